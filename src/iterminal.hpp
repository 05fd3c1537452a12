#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh).
 * Goal: the renderer draws through this, so it runs against ncurses or the
 *       headless grid used by the tests.
 */
#include <string>

struct TermSize { int rows; int cols; };

/* color pair ids understood by every backend */
enum TermColor { kColorDefault = 0, kColorGutter = 1, kColorStatus = 2 };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
};

#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal that draws into an in-memory character grid; used by
 *          automated tests to check what the renderer put on screen.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refresh_count_++; }
  void clear_to_eol(int row, int col) override;

  /* row text with trailing blanks stripped */
  std::string row_text(int row) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refresh_count() const { return refresh_count_; }

private:
  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refresh_count_ = 0;
};

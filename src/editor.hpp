#pragma once
/*
 * Editor
 *
 * Purpose: terminal demo of elastic tabstops. Holds one TextBlock and turns
 *          every keystroke into a TextBlock edit, so the widths on screen
 *          are always the incrementally maintained ones.
 * Note: a line's raw text is its cells joined with the delimiter; the cursor
 *       column is a byte offset into that raw text.
 */
#include <optional>
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"
#include "text_block.hpp"
#include "input.hpp"
#include "renderer.hpp"
#include "ncurses_terminal.hpp"
#include "cmd_registry.hpp"

class Editor {
public:
  explicit Editor(const std::optional<std::filesystem::path>& file);
  void run();

private:
  struct Register {
    std::vector<Cells> lines;
  } reg;

  NcursesTerminal term;
  TextBlock block;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  Cursor cur;
  Viewport vp;
  Mode mode = Mode::Normal;
  char delimiter = ET_DEFAULT_DELIMITER;
  bool show_line_numbers = false;
  bool should_quit = false;
  std::string message;
  std::string cmdline;
  Input input;
  Renderer renderer;
  CommandRegistry registry;

  void render();
  void handle_input(int ch);
  void handle_normal_input(int ch);
  void handle_insert_input(int ch);
  void handle_command_input(int ch);
  void execute_command();
  void register_commands();
  void load_rc();
  bool close_or_quit(bool force);
  bool write_to(const std::filesystem::path& path);

  std::string raw_line(int row) const;
  void set_raw_line(int row, const std::string& s);
  int max_col_for_row(int row) const;
  void clamp_cursor();

  void move_left();
  void move_right();
  void move_up();
  void move_down();
  void delete_char();
  void delete_lines(int count);
  void yank_lines(int count);
  void paste_below();
  void paste_above();
  void open_line_below();
  void open_line_above();
  void insert_char(char ch);
  void backspace();
  void split_line_at_cursor();
  void ensure_not_empty();

  void set_tab_stops(const TabStops& stops);
  void set_delimiter(char d);
};

#include "ncurses_terminal.hpp"
#include <locale.h>

NcursesTerminal::NcursesTerminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(kColorGutter, COLOR_YELLOW, -1);
      init_pair(kColorStatus, COLOR_BLACK, COLOR_CYAN);
    } else {
      init_pair(kColorGutter, COLOR_YELLOW, COLOR_BLACK); // fallback
      init_pair(kColorStatus, COLOR_BLACK, COLOR_WHITE);
    }
  }
}

NcursesTerminal::~NcursesTerminal() { endwin(); }

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (!has_colors() || color_pair_id == kColorDefault) { draw_text(row, col, text); return; }
  attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key() { return getch(); }

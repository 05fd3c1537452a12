#include "cells.hpp"
#include <cassert>
#include <string>
#include <vector>

void run_cells_tests() {
  assert((split_cells("a\tb\tc") == Cells{"a", "b", "c"}));
  assert((split_cells("") == Cells{""}));
  assert((split_cells("a\t") == Cells{"a", ""}));
  assert((split_cells("\t\t") == Cells{"", "", ""}));
  assert((split_cells("x,y", ',') == Cells{"x", "y"}));
  assert((split_cells("x\ty", ',') == Cells{"x\ty"}));

  for (const char* s : {"", "a", "a\tb", "\t", "one\ttwo\t\tfour"}) {
    assert(join_cells(split_cells(s)) == s);
  }
  assert(join_cells(Cells{}) == "");

  assert(text_size("hello") == 5);
  assert(column_count(0) == 0);
  assert(column_count(1) == 0);
  assert(column_count(4) == 3);

  assert((tab_stop_positions({}) == std::vector<int>{0}));
  assert((tab_stop_positions({3, 4}) == std::vector<int>{0, 3, 7}));

  CellPos p = locate_cell("ab\tcd", 4);
  assert(p.cell == 1 && p.offset == 1);
  p = locate_cell("ab\tcd", 2);
  assert(p.cell == 0 && p.offset == 2);
  p = locate_cell("ab\tcd", 3);
  assert(p.cell == 1 && p.offset == 0);
  p = locate_cell("ab\tcd", 99);
  assert(p.cell == 1 && p.offset == 2);

  Cells cells = {"ab", "cd", "e"};
  std::vector<int> widths = {3, 5};
  assert(display_column(cells, widths, {0, 1}) == 1);
  assert(display_column(cells, widths, {1, 1}) == 4);
  assert(display_column(cells, widths, {2, 0}) == 8);
}

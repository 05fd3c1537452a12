#include "cells.hpp"
#include <algorithm>

Cells split_cells(std::string_view text, char delimiter) {
  Cells cells;
  size_t st = 0;
  while (st <= text.size()) {
    size_t pos = text.find(delimiter, st);
    if (pos == std::string_view::npos) { cells.emplace_back(text.substr(st)); break; }
    cells.emplace_back(text.substr(st, pos - st));
    st = pos + 1;
  }
  return cells;
}

std::string join_cells(const Cells& cells, char delimiter) {
  std::string out;
  for (size_t i = 0; i < cells.size(); ++i) {
    if (i > 0) out.push_back(delimiter);
    out += cells[i];
  }
  return out;
}

int text_size(const std::string& cell) { return static_cast<int>(cell.size()); }

std::vector<int> tab_stop_positions(const std::vector<int>& widths) {
  std::vector<int> pos;
  pos.reserve(widths.size() + 1);
  int acc = 0;
  pos.push_back(acc);
  for (int w : widths) { acc += w; pos.push_back(acc); }
  return pos;
}

CellPos locate_cell(std::string_view text, size_t offset, char delimiter) {
  offset = std::min(offset, text.size());
  CellPos p;
  size_t cell_start = 0;
  for (size_t i = 0; i < offset; ++i) {
    if (text[i] == delimiter) { p.cell++; cell_start = i + 1; }
  }
  p.offset = offset - cell_start;
  return p;
}

int display_column(const Cells& cells, const std::vector<int>& widths, CellPos pos) {
  int col = 0;
  size_t n = std::min({pos.cell, widths.size(), cells.size()});
  for (size_t c = 0; c < n; ++c) col += widths[c];
  return col + static_cast<int>(pos.offset);
}

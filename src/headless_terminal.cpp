#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
    : rows_(rows), cols_(cols), grid_(static_cast<size_t>(rows), std::string(static_cast<size_t>(cols), ' ')) {}

void HeadlessTerminal::clear() {
  for (auto& r : grid_) r.assign(static_cast<size_t>(cols_), ' ');
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  std::string& line = grid_[static_cast<size_t>(row)];
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    line[static_cast<size_t>(c)] = text[i];
  }
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int) {
  draw_text(row, col, text);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_ || col >= cols_) return;
  std::string& line = grid_[static_cast<size_t>(row)];
  for (int c = std::max(0, col); c < cols_; ++c) line[static_cast<size_t>(c)] = ' ';
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  const std::string& line = grid_[static_cast<size_t>(row)];
  size_t end = line.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : line.substr(0, end + 1);
}

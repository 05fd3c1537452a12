#include "renderer.hpp"
#include <algorithm>
#include <string>

std::string Renderer::layout_line(const Cells& cells, const std::vector<int>& widths) {
  std::string out;
  size_t stop = 0;
  for (size_t c = 0; c < cells.size(); ++c) {
    out += cells[c];
    if (c < widths.size()) {
      stop += static_cast<size_t>(widths[c]);
      if (out.size() < stop) out.append(stop - out.size(), ' ');
    }
  }
  return out;
}

static std::string mode_tag(Mode mode) {
  return mode == Mode::Insert ? "-- INSERT --" : "";
}

void Renderer::render(ITerminal& term, const RenderInfo& info) {
  TermSize sz = term.getSize();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0 || !info.block || !info.vp) { term.refresh(); return; }
  const TextBlock& block = *info.block;
  Viewport& vp = *info.vp;
  const Cursor& cur = info.cur;

  int max_text_rows = std::max(0, rows - 1);
  if (cur.row < vp.top_line) vp.top_line = cur.row;
  if (cur.row >= vp.top_line + max_text_rows) vp.top_line = cur.row - max_text_rows + 1;
  vp.top_line = std::max(0, vp.top_line);

  int indent = 0;
  if (info.show_line_numbers) {
    int digits = 1;
    int total = std::max(1, block.line_count());
    while (total >= 10) { total /= 10; digits++; }
    indent = digits + 1; // one space after numbers
  }
  int text_cols = std::max(0, cols - indent);

  int first = std::min(vp.top_line, block.line_count());
  int last = std::min(block.line_count(), vp.top_line + max_text_rows);
  TabWidths widths = block.widths(first, last);

  // horizontal scroll follows the cursor's rendered column
  int cursor_screen_col = 0;
  if (cur.row >= first && cur.row < last) {
    const Cells& cells = block.line(cur.row);
    std::string raw = join_cells(cells, info.delimiter);
    const auto& w = widths[static_cast<size_t>(cur.row - first)];
    cursor_screen_col = display_column(cells, w, locate_cell(raw, static_cast<size_t>(std::max(0, cur.col)), info.delimiter));
  }
  if (cursor_screen_col < vp.left_col) vp.left_col = cursor_screen_col;
  if (text_cols > 0 && cursor_screen_col >= vp.left_col + text_cols) vp.left_col = cursor_screen_col - text_cols + 1;

  for (int screen_row = 0; screen_row < max_text_rows; ++screen_row) {
    int r = vp.top_line + screen_row;
    if (r >= block.line_count()) {
      term.draw_colored(screen_row, 0, "~", kColorGutter);
      continue;
    }
    if (info.show_line_numbers) {
      std::string num = std::to_string(r + 1);
      num.insert(num.begin(), static_cast<size_t>(std::max(0, indent - 1 - static_cast<int>(num.size()))), ' ');
      term.draw_colored(screen_row, 0, num, kColorGutter);
    }
    std::string text = layout_line(block.line(r), widths[static_cast<size_t>(r - first)]);
    if (vp.left_col < static_cast<int>(text.size())) {
      std::string visible = text.substr(static_cast<size_t>(vp.left_col), static_cast<size_t>(text_cols));
      term.draw_text(screen_row, indent, visible);
    }
  }

  int status_row = rows - 1;
  if (info.mode == Mode::Command) {
    term.draw_text(status_row, 0, ":" + info.cmdline);
  } else {
    std::string left = info.message;
    if (left.empty()) {
      left = mode_tag(info.mode);
      if (left.empty()) left = info.file_path ? info.file_path->filename().string() : std::string("[No Name]");
      if (info.modified) left += " [+]";
    }
    std::string right = std::to_string(cur.row + 1) + "," + std::to_string(cur.col + 1);
    std::string bar = left;
    int gap = cols - static_cast<int>(left.size()) - static_cast<int>(right.size());
    if (gap > 0) bar += std::string(static_cast<size_t>(gap), ' ') + right;
    if (static_cast<int>(bar.size()) > cols) bar.resize(static_cast<size_t>(cols));
    term.draw_colored(status_row, 0, bar, kColorStatus);
  }

  if (info.mode == Mode::Command) {
    term.move_cursor(status_row, std::min(cols - 1, 1 + static_cast<int>(info.cmdline.size())));
  } else {
    int screen_row = cur.row - vp.top_line;
    term.move_cursor(screen_row, std::min(cols - 1, indent + cursor_screen_col - vp.left_col));
  }
  term.refresh();
}

#include "tab_widths.hpp"
#include <algorithm>
#include <utility>

namespace {

/* a run of consecutive lines with the same column count */
struct LineGroup {
  size_t first_line;
  size_t columns;
};

}

TabWidths compute_tab_widths(const std::vector<std::vector<int>>& line_sizes,
                             const TabStops& tab_stops,
                             const WidthHints& hints) {
  // slots hold the running max of one column within one run; column_slots
  // maps the columns open at the current line to their slot
  std::vector<int> slots(hints.start.begin(), hints.start.end());
  std::vector<size_t> initial_columns(slots.size());
  for (size_t i = 0; i < initial_columns.size(); ++i) initial_columns[i] = i;
  std::vector<size_t> column_slots = initial_columns;

  std::vector<LineGroup> groups;
  size_t prev_columns = static_cast<size_t>(-1);
  for (size_t row = 0; row < line_sizes.size(); ++row) {
    const auto& sizes = line_sizes[row];
    size_t cols = column_count(sizes.size());
    for (size_t c = 0; c < cols; ++c) {
      int w = tab_stops.width(sizes[c]);
      if (c >= column_slots.size()) {
        slots.push_back(w);
        column_slots.push_back(slots.size() - 1);
      } else {
        int& s = slots[column_slots[c]];
        s = std::max(s, w);
      }
    }
    if (column_slots.size() > cols) column_slots.resize(cols);
    if (cols != prev_columns) groups.push_back({row, cols});
    prev_columns = cols;
  }

  // lines below the window keep growing the runs still open at the end
  size_t open = std::min(hints.end.size(), column_slots.size());
  for (size_t c = 0; c < open; ++c) {
    int& s = slots[column_slots[c]];
    s = std::max(s, hints.end[c]);
  }
  groups.push_back({line_sizes.size(), 0});

  // replay: slots were handed out in line order, so walking the groups again
  // reproduces each line's column → slot mapping with the final maxima
  TabWidths out;
  out.reserve(line_sizes.size());
  column_slots = std::move(initial_columns);
  size_t next_slot = column_slots.size();
  size_t row = 0;
  for (const auto& g : groups) {
    for (; row < g.first_line; ++row) {
      std::vector<int> widths;
      widths.reserve(column_slots.size());
      for (size_t s : column_slots) widths.push_back(slots[s]);
      out.push_back(std::move(widths));
    }
    while (column_slots.size() < g.columns) column_slots.push_back(next_slot++);
    if (column_slots.size() > g.columns) column_slots.resize(g.columns);
  }
  return out;
}

TabWidths compute_tab_widths(const std::vector<Cells>& lines,
                             const TabStops& tab_stops,
                             const SizeFunc& size_func,
                             const WidthHints& hints) {
  std::vector<std::vector<int>> sizes;
  sizes.reserve(lines.size());
  for (const auto& cells : lines) {
    std::vector<int> s;
    s.reserve(cells.size());
    size_t cols = column_count(cells.size());
    for (size_t c = 0; c < cols; ++c) s.push_back(size_func(cells[c]));
    if (!cells.empty()) s.push_back(0); // last cell, never measured
    sizes.push_back(std::move(s));
  }
  return compute_tab_widths(sizes, tab_stops, hints);
}

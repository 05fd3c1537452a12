#pragma once
/*
 * compute_tab_widths
 *
 * Purpose: one-shot elastic tab widths for a list of lines.
 * Input: per line the raw cell sizes, last cell included (it is ignored).
 * Hints: widths already agreed by lines just above/below the given window;
 *        empty hints mean a block boundary. Hints are widths, not sizes.
 * Output: one width list per line, length = line's column count.
 */
#include <vector>
#include "cells.hpp"
#include "tab_stops.hpp"

using TabWidths = std::vector<std::vector<int>>;

struct WidthHints {
  std::vector<int> start;
  std::vector<int> end;
};

TabWidths compute_tab_widths(const std::vector<std::vector<int>>& line_sizes,
                             const TabStops& tab_stops,
                             const WidthHints& hints = {});

TabWidths compute_tab_widths(const std::vector<Cells>& lines,
                             const TabStops& tab_stops,
                             const SizeFunc& size_func,
                             const WidthHints& hints = {});

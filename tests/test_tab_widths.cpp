#include "tab_widths.hpp"
#include "test_util.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

/* same shape as the shared golden fixtures: textBlock, tabStops, params, tabSizes */
struct GoldenCase {
  const char* name;
  std::vector<Cells> text_block;
  TabStops tab_stops;
  WidthHints params;
  TabWidths tab_sizes;
};

std::vector<GoldenCase> golden_cases() {
  return {
    {"empty", {}, TabStops(), {}, {}},
    {"hello-world", {{"Hello", "world"}}, TabStops(), {}, {{6}}},
    {"single-cell", {Cells{"Hello"}}, TabStops(), {}, {std::vector<int>{}}},
    {"no-cells", {Cells{}}, TabStops(), {}, {std::vector<int>{}}},
    {"small-world", {{"it", "is", "a"}, {"small", "world"}}, TabStops(), {}, {{6, 3}, {6}}},
    {"block-break", {{"a", "b"}, {"c"}, {"dd", "e"}}, TabStops(), {}, {{2}, {}, {3}}},
    {"nested-columns",
     {{"x", "yy", "z"}, {"xxx", "y", "z"}, {"x", "end"}, {"x", "yyyy", "z"}},
     TabStops(), {}, {{4, 3}, {4, 3}, {4}, {4, 5}}},
    {"stepped-stops",
     {{"abcde", "x"}, {"a", "y"}, {"", " z"}},
     TabStops(2, 4, 4), {}, {{10}, {10}, {10}}},
    {"start-hint", {{"ab", "c"}}, TabStops(), {{10}, {}}, {{10}}},
    {"start-hint-new-column", {{"a", "b", "c"}}, TabStops(), {{7}, {}}, {{7, 2}}},
    {"start-hint-cut", {{"a", "b"}, {"cc", "d", "e"}}, TabStops(), {{7, 9}, {}}, {{7}, {7, 2}}},
    {"end-hint", {{"ab", "cd", "e"}}, TabStops(), {{}, {5, 1}}, {{5, 3}}},
    {"end-hint-cut", {{"a", "b", "c"}, {"d"}}, TabStops(), {{}, {9, 9}}, {{2, 2}, {}}},
    {"both-hints",
     {{"a", "b", "c"}, {"bb", "x"}},
     TabStops(), {{4}, {1, 8}}, {{4, 2}, {4}}},
  };
}

}

static void check_golden() {
  for (const auto& g : golden_cases()) {
    TabWidths got = compute_tab_widths(g.text_block, g.tab_stops, text_size, g.params);
    if (got != g.tab_sizes) std::cerr << "golden case failed: " << g.name << "\n";
    assert(got == g.tab_sizes);
  }
}

static void check_raw_sizes() {
  // sizes given directly; the last size of each line is never looked at
  std::vector<std::vector<int>> sizes = {{5, 1000}, {2, 3, 1000}, {0}};
  TabWidths w = compute_tab_widths(sizes, TabStops());
  assert((w == TabWidths{{6}, {6, 4}, {}}));
}

static void check_size_func_skips_last_cell() {
  int calls = 0;
  SizeFunc counting = [&calls](const std::string& s) { calls++; return static_cast<int>(s.size()); };
  compute_tab_widths(std::vector<Cells>{{"a", "b", "c"}, {"d"}}, TabStops(), counting);
  assert(calls == 2);
}

static void check_one_width_list_per_line() {
  auto lines = cells_of_lengths({{1, 2, 3, 4}, {}, {5}, {6, 1}, {2, 2, 2}, {9, 9, 9, 9, 9}, {1, 1}});
  TabWidths w = compute_tab_widths(lines, TabStops(), text_size);
  assert(w.size() == lines.size());
  for (size_t i = 0; i < lines.size(); ++i) assert(w[i].size() == column_count(lines[i].size()));
}

void run_tab_widths_tests() {
  check_golden();
  check_raw_sizes();
  check_size_func_skips_last_cell();
  check_one_width_list_per_line();
}

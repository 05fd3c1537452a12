#include "text_block.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iterator>
#include <limits>
#include <map>
#include <set>
#include <utility>

static std::string range_text(int start, int end, int n) {
  return "[" + std::to_string(start) + ", " + std::to_string(end) + ") of " + std::to_string(n) + " lines";
}

TextBlock::TextBlock(const TabStops& tab_stops, SizeFunc size_func)
    : tab_stops_(tab_stops), size_func_(std::move(size_func)) {}

TextBlock::TextBlock(std::vector<Cells> lines, const TabStops& tab_stops, SizeFunc size_func)
    : tab_stops_(tab_stops), size_func_(std::move(size_func)) {
  edit(0, 0, std::move(lines));
}

size_t TextBlock::resolve_row(int row, const char* op) const {
  int n = line_count();
  int r = row < 0 ? row + n : row;
  if (r < 0 || r >= n) {
    throw IndexError(std::string(op) + ": row " + std::to_string(row) + " out of range for " + std::to_string(n) + " lines");
  }
  return static_cast<size_t>(r);
}

const Cells& TextBlock::line(int row) const {
  int n = line_count();
  if (row < 0 || row >= n) {
    throw IndexError("line: row " + std::to_string(row) + " out of range for " + std::to_string(n) + " lines");
  }
  return lines_[static_cast<size_t>(row)];
}

std::vector<std::vector<int>> TextBlock::measure(const std::vector<Cells>& lines) const {
  std::vector<std::vector<int>> out;
  out.reserve(lines.size());
  for (const auto& cells : lines) {
    size_t cols = column_count(cells.size());
    std::vector<int> w;
    w.reserve(cols);
    for (size_t c = 0; c < cols; ++c) w.push_back(tab_stops_.width(size_func_(cells[c])));
    out.push_back(std::move(w));
  }
  return out;
}

void TextBlock::detach(size_t start, size_t end) {
  for (size_t r = start; r < end; ++r) {
    for (auto& ref : columns_[r]) ref.set->remove(ref.width);
  }
}

void TextBlock::attach(size_t row, const std::vector<int>& widths, std::vector<SetHandle>& carried) {
  LineColumns& cols = columns_[row];
  cols.reserve(widths.size());
  for (size_t c = 0; c < widths.size(); ++c) {
    if (c >= carried.size()) carried.push_back(std::make_shared<ColumnWidthMultiset>());
    carried[c]->insert(widths[c]);
    cols.push_back({carried[c], widths[c]});
  }
  // a shorter line closes the runs of the columns it does not have
  if (carried.size() > widths.size()) carried.resize(widths.size());
}

void TextBlock::relink_following(size_t row, std::vector<SetHandle>& carried) {
  // carried holds the runs open at the line just above `row`. Following lines
  // join them (or fresh runs) column by column; once a line needs no change
  // every line below it is already linked correctly.
  size_t open = std::numeric_limits<size_t>::max();
  for (size_t r = row; r < lines_.size(); ++r) {
    LineColumns& cols = columns_[r];
    open = std::min(open, cols.size());
    if (open == 0) break;
    bool changed = false;
    for (size_t c = 0; c < open; ++c) {
      if (c >= carried.size()) carried.push_back(std::make_shared<ColumnWidthMultiset>());
      ColumnRef& ref = cols[c];
      if (ref.set == carried[c]) continue;
      ref.set->remove(ref.width);
      carried[c]->insert(ref.width);
      ref.set = carried[c];
      changed = true;
    }
    if (!changed) break;
  }
}

void TextBlock::edit(int start, int end, std::vector<Cells> new_lines) {
  int n = line_count();
  int s = start < 0 ? start + n : start;
  int e = end < 0 ? end + n : end;
  if (s < 0 || e < 0 || s > n || e > n || s > e) {
    throw IndexError("edit: bad range " + range_text(start, end, n));
  }
  // measure first: a throwing size function leaves the block untouched
  auto new_widths = measure(new_lines);

  size_t us = static_cast<size_t>(s);
  size_t ue = static_cast<size_t>(e);
  detach(us, ue);

  size_t count = new_lines.size();
  lines_.erase(lines_.begin() + s, lines_.begin() + e);
  lines_.insert(lines_.begin() + s, std::make_move_iterator(new_lines.begin()), std::make_move_iterator(new_lines.end()));
  columns_.erase(columns_.begin() + s, columns_.begin() + e);
  columns_.insert(columns_.begin() + s, count, LineColumns());

  std::vector<SetHandle> carried;
  if (us > 0) {
    for (const auto& ref : columns_[us - 1]) carried.push_back(ref.set);
  }
  for (size_t i = 0; i < count; ++i) attach(us + i, new_widths[i], carried);
  relink_following(us + count, carried);
}

TabWidths TextBlock::widths(int start, int end) const {
  int n = line_count();
  if (start < 0 || end < 0 || start > n || end > n || start > end) {
    throw IndexError("widths: bad range " + range_text(start, end, n));
  }
  TabWidths out;
  out.reserve(static_cast<size_t>(end - start));
  for (int r = start; r < end; ++r) {
    const auto& cols = columns_[static_cast<size_t>(r)];
    std::vector<int> w;
    w.reserve(cols.size());
    for (const auto& ref : cols) w.push_back(ref.set->max());
    out.push_back(std::move(w));
  }
  return out;
}

std::vector<int> TextBlock::line_widths(int row) const {
  size_t r = resolve_row(row, "line_widths");
  std::vector<int> w;
  for (const auto& ref : columns_[r]) w.push_back(ref.set->max());
  return w;
}

void TextBlock::insert_line(int row, Cells cells) {
  std::vector<Cells> v;
  v.push_back(std::move(cells));
  edit(row, row, std::move(v));
}

void TextBlock::insert_lines(int row, std::vector<Cells> lines) { edit(row, row, std::move(lines)); }

void TextBlock::append_line(Cells cells) { insert_line(line_count(), std::move(cells)); }

void TextBlock::extend(std::vector<Cells> lines) {
  int n = line_count();
  edit(n, n, std::move(lines));
}

void TextBlock::erase_line(int row) {
  int r = static_cast<int>(resolve_row(row, "erase_line"));
  edit(r, r + 1, {});
}

void TextBlock::erase_lines(int start_row, int end_row) { edit(start_row, end_row, {}); }

void TextBlock::replace_line(int row, Cells cells) {
  int r = static_cast<int>(resolve_row(row, "replace_line"));
  std::vector<Cells> v;
  v.push_back(std::move(cells));
  edit(r, r + 1, std::move(v));
}

void TextBlock::replace_lines(int start_row, int end_row, std::vector<Cells> lines) {
  edit(start_row, end_row, std::move(lines));
}

void TextBlock::assign(std::vector<Cells> lines) { edit(0, line_count(), std::move(lines)); }

Cells TextBlock::pop_line(int row) {
  int r = static_cast<int>(resolve_row(row, "pop_line"));
  Cells cells = lines_[static_cast<size_t>(r)];
  edit(r, r + 1, {});
  return cells;
}

void TextBlock::clear() { edit(0, line_count(), {}); }

size_t TextBlock::run_count() const {
  std::set<const ColumnWidthMultiset*> seen;
  for (const auto& cols : columns_) {
    for (const auto& ref : cols) seen.insert(ref.set.get());
  }
  return seen.size();
}

bool TextBlock::check_consistency(std::string* why) const {
  auto fail = [why](std::string msg) {
    if (why) *why = std::move(msg);
    return false;
  };
  if (columns_.size() != lines_.size()) return fail("column table and lines differ in length");
  std::map<const ColumnWidthMultiset*, std::map<int, size_t>> expected;
  for (size_t r = 0; r < lines_.size(); ++r) {
    const auto& cols = columns_[r];
    const auto& cells = lines_[r];
    std::string at = "line " + std::to_string(r);
    if (cols.size() != column_count(cells.size())) return fail(at + ": wrong column count");
    for (size_t c = 0; c < cols.size(); ++c) {
      const auto& ref = cols[c];
      if (!ref.set) return fail(at + ": missing multiset");
      if (ref.width != tab_stops_.width(size_func_(cells[c]))) return fail(at + ": stale width");
      bool joins_above = r > 0 && columns_[r - 1].size() > c;
      bool shares_above = joins_above && columns_[r - 1][c].set == ref.set;
      if (joins_above != shares_above) return fail(at + ": run not shared with line above");
      if (!joins_above && expected.count(ref.set.get())) return fail(at + ": multiset reused by a disjoint run");
      expected[ref.set.get()][ref.width]++;
    }
  }
  for (size_t r = 0; r < columns_.size(); ++r) {
    for (const auto& ref : columns_[r]) {
      const auto& counts = expected[ref.set.get()];
      size_t total = 0;
      for (const auto& [value, k] : counts) {
        if (ref.set->count(value) != k) return fail("line " + std::to_string(r) + ": multiset contents differ");
        total += k;
      }
      if (ref.set->size() != total) return fail("line " + std::to_string(r) + ": multiset has extra members");
    }
  }
  return true;
}

#pragma once
/*
 * TextBlock
 *
 * Purpose: lines of cells plus their elastic tab widths, kept up to date
 *          incrementally on every edit.
 * Model: each line holds, per column, a handle to the ColumnWidthMultiset of
 *        the run it belongs to (lines of one run share the same handle) and
 *        the width it contributed to that multiset.
 * Edits: everything goes through edit(start, end, new_lines); only the edited
 *        lines and the runs whose membership changes are touched.
 * Note: not copyable (copies would alias the shared multisets); movable.
 */
#include <memory>
#include <string>
#include <vector>
#include "cells.hpp"
#include "column_width_multiset.hpp"
#include "tab_stops.hpp"
#include "tab_widths.hpp"

class TextBlock {
public:
  explicit TextBlock(const TabStops& tab_stops = TabStops(), SizeFunc size_func = text_size);
  explicit TextBlock(std::vector<Cells> lines, const TabStops& tab_stops = TabStops(), SizeFunc size_func = text_size);
  TextBlock(const TextBlock&) = delete;
  TextBlock& operator=(const TextBlock&) = delete;
  TextBlock(TextBlock&&) = default;
  TextBlock& operator=(TextBlock&&) = default;

  int line_count() const { return static_cast<int>(lines_.size()); }
  bool empty() const { return lines_.empty(); }
  const Cells& line(int row) const;
  const std::vector<Cells>& lines() const { return lines_; }
  const TabStops& tab_stops() const { return tab_stops_; }

  /* replace lines [start, end) by new_lines; negative indices count from the end */
  void edit(int start, int end, std::vector<Cells> new_lines);

  TabWidths widths() const { return widths(0, line_count()); }
  TabWidths widths(int start, int end) const;
  std::vector<int> line_widths(int row) const;

  void insert_line(int row, Cells cells);
  void insert_lines(int row, std::vector<Cells> lines);
  void append_line(Cells cells);
  void extend(std::vector<Cells> lines);
  void erase_line(int row);
  void erase_lines(int start_row, int end_row); // end_row exclusive
  void replace_line(int row, Cells cells);
  void replace_lines(int start_row, int end_row, std::vector<Cells> lines);
  void assign(std::vector<Cells> lines);
  Cells pop_line(int row = -1);
  void clear();

  /* recheck run sharing and multiset contents against the lines; false + why on mismatch */
  bool check_consistency(std::string* why = nullptr) const;
  /* number of distinct column runs, i.e. live multisets referenced by the block */
  size_t run_count() const;

private:
  using SetHandle = std::shared_ptr<ColumnWidthMultiset>;
  struct ColumnRef {
    SetHandle set;
    int width;
  };
  using LineColumns = std::vector<ColumnRef>;

  std::vector<Cells> lines_;
  std::vector<LineColumns> columns_; // parallel to lines_
  TabStops tab_stops_;
  SizeFunc size_func_;

  size_t resolve_row(int row, const char* op) const;
  std::vector<std::vector<int>> measure(const std::vector<Cells>& lines) const;
  void detach(size_t start, size_t end);
  void attach(size_t row, const std::vector<int>& widths, std::vector<SetHandle>& carried);
  void relink_following(size_t row, std::vector<SetHandle>& carried);
};

#pragma once
/*
 * ColumnWidthMultiset
 *
 * Purpose: widths contributed by every line of one run to one column.
 * Shared: all lines of the run hold the same instance (see TextBlock).
 * Cost: insert/remove/max are O(log distinct widths) via an ordered count map.
 */
#include <cstddef>
#include <map>

class ColumnWidthMultiset {
public:
  void insert(int value);
  void remove(int value); // one occurrence; throws MultisetValueNotFound
  int max() const;        // throws MultisetEmpty
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  size_t count(int value) const;

private:
  std::map<int, size_t> counts_;
  size_t size_ = 0;
};

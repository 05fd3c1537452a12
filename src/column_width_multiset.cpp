#include "column_width_multiset.hpp"
#include "errors.hpp"

void ColumnWidthMultiset::insert(int value) {
  counts_[value]++;
  size_++;
}

void ColumnWidthMultiset::remove(int value) {
  auto it = counts_.find(value);
  if (it == counts_.end()) throw MultisetValueNotFound(value);
  if (--it->second == 0) counts_.erase(it);
  size_--;
}

int ColumnWidthMultiset::max() const {
  if (counts_.empty()) throw MultisetEmpty();
  return counts_.rbegin()->first;
}

size_t ColumnWidthMultiset::count(int value) const {
  auto it = counts_.find(value);
  return it == counts_.end() ? 0 : it->second;
}

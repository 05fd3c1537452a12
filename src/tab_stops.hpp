#pragma once
/*
 * TabStops
 *
 * Purpose: turn the measured size of a cell into the width of its column.
 * Rule: width = margin + max(ceil(size / step_size) * step_size, min_size).
 * Note: sizes and widths are view units (chars, pixels...), always int here.
 */
#include "config.hpp"

class TabStops {
public:
  TabStops() = default;
  TabStops(int margin, int min_size, int step_size);

  int margin() const { return margin_; }
  int min_size() const { return min_size_; }
  int step_size() const { return step_size_; }

  int width(int size) const;

  bool operator==(const TabStops&) const = default;

private:
  int margin_ = ET_DEFAULT_MARGIN;
  int min_size_ = ET_DEFAULT_MIN_SIZE;
  int step_size_ = ET_DEFAULT_STEP_SIZE;
};

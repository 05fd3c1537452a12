#include "tab_stops.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>

TabStops::TabStops(int margin, int min_size, int step_size)
    : margin_(margin), min_size_(min_size), step_size_(step_size) {
  if (step_size <= 0) throw ConfigurationError("tab stops: step_size must be > 0, got " + std::to_string(step_size));
  if (margin < 0) throw ConfigurationError("tab stops: margin must be >= 0, got " + std::to_string(margin));
  if (min_size < 0) throw ConfigurationError("tab stops: min_size must be >= 0, got " + std::to_string(min_size));
}

int TabStops::width(int size) const {
  // round up, not floor + 1: the margin is configured separately
  int steps = size / step_size_;
  if (size > 0 && size % step_size_ != 0) steps++;
  return margin_ + std::max(steps * step_size_, min_size_);
}

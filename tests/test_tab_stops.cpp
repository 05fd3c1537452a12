#include "tab_stops.hpp"
#include "errors.hpp"
#include "test_util.hpp"
#include <cassert>

void run_tab_stops_tests() {
  TabStops def;
  assert(def.margin() == 1 && def.min_size() == 1 && def.step_size() == 1);
  assert(def.width(10) == 11);
  assert(def.width(5) == 6);
  assert(def.width(0) == 2); // min_size 1 + margin 1
  assert(def == TabStops(1, 1, 1));

  // rounds up to the step, then applies the minimum, then the margin
  TabStops px(8, 32, 1);
  assert(px.width(10) == 40);
  assert(px.width(40) == 48);
  TabStops stepped(2, 4, 4);
  assert(stepped.width(0) == 6);
  assert(stepped.width(1) == 6);
  assert(stepped.width(4) == 6);
  assert(stepped.width(5) == 10);
  assert(stepped.width(8) == 10);
  assert(stepped.width(9) == 14);
  TabStops bare(0, 0, 3);
  assert(bare.width(0) == 0);
  assert(bare.width(7) == 9);

  // never below the margin, never decreasing
  for (const TabStops& t : {def, px, stepped, bare}) {
    int prev = t.width(0);
    for (int size = 0; size < 200; ++size) {
      int w = t.width(size);
      assert(w >= t.margin());
      assert(w >= prev);
      assert(w >= size + t.margin());
      prev = w;
    }
  }

  assert(throws_as<ConfigurationError>([]{ TabStops(1, 1, 0); }));
  assert(throws_as<ConfigurationError>([]{ TabStops(1, 1, -4); }));
  assert(throws_as<ConfigurationError>([]{ TabStops(-1, 1, 1); }));
  assert(throws_as<std::invalid_argument>([]{ TabStops(1, -1, 1); }));
}

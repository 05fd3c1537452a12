#include "input.hpp"

bool Input::consumeDouble(bool& pending, int ch, int key) {
  if (ch != key) return false;
  if (pending) { pending = false; return true; }
  pending = true;
  return false;
}

bool Input::consumeDd(int ch) { return consumeDouble(pending_d_, ch, 'd'); }
bool Input::consumeYy(int ch) { return consumeDouble(pending_y_, ch, 'y'); }
bool Input::consumeGg(int ch) { return consumeDouble(pending_g_, ch, 'g'); }

bool Input::consumeDigit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
    return true;
  }
  if (ch == '0' && pending_count_ > 0) {
    pending_count_ = pending_count_ * 10;
    return true;
  }
  return false;
}

bool Input::hasCount() const { return pending_count_ > 0; }

size_t Input::takeCount() {
  size_t c = pending_count_;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_d_ = false;
  pending_y_ = false;
  pending_g_ = false;
}

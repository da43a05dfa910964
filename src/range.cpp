#include "range.hpp"

Pos Range::before() const { return from.comes_before(to) ? from : to; }

Pos Range::after() const { return from.comes_before(to) ? to : from; }

bool Range::contains_pos(Pos pos) const {
  if (before().comes_before(pos) && after().comes_after(pos)) return true;
  return from == pos || to == pos;
}

bool Range::contains_range(const Range& other) const {
  return contains_pos(other.from) && contains_pos(other.to);
}

bool Range::eql(const Range& a, const Range& b) {
  return a.before() == b.before() && a.after() == b.after();
}

bool Range::strict_eql(const Range& a, const Range& b) {
  return a.from == b.from && a.to == b.to;
}

// checked both ways so a range nested strictly inside the other still overlaps
bool Range::has_overlap(const Range& a, const Range& b) {
  return a.contains_pos(b.from) || a.contains_pos(b.to) || b.contains_pos(a.from) || b.contains_pos(a.to);
}

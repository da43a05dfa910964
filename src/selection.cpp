#include "selection.hpp"
#include <cassert>

bool Selection::eql(const Selection& a, const Selection& b) {
  return Range::eql(a.to_range(), b.to_range());
}

bool Selection::strict_eql(const Selection& a, const Selection& b) {
  return a.anchor == b.anchor && a.cursor == b.cursor;
}

bool Selection::has_overlap(const Selection& a, const Selection& b) {
  return Range::has_overlap(a.to_range(), b.to_range());
}

bool Selection::comes_before(const Selection& a, const Selection& b) {
  assert(!has_overlap(a, b));
  return a.after().comes_before(b.before());
}

Selection Selection::merge(const Selection& a, const Selection& b) {
  assert(has_overlap(a, b));

  const Range ra = a.to_range();
  const Range rb = b.to_range();
  if (ra.contains_range(rb)) return a;
  if (rb.contains_range(ra)) return b;

  // a cannot sit inside b here, so it touches one side of b
  if (a.is_cursor()) {
    if (a.anchor.comes_before(rb.before())) return Selection{a.anchor, rb.after()};
    return Selection{rb.before(), a.cursor};
  }

  if (a.anchor.comes_before(a.cursor)) {
    if (a.anchor.comes_after(rb.before())) return Selection{rb.before(), a.cursor};
    return Selection{a.anchor, rb.after()};
  }

  if (a.cursor.comes_after(rb.before())) return Selection{a.anchor, rb.before()};
  return Selection{rb.after(), a.cursor};
}

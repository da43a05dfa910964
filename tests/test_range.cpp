#include "range.hpp"
#include <cassert>

int main() {
  Range r{Pos{1, 4}, Pos{0, 2}};
  assert((r.before() == Pos{0, 2}));
  assert((r.after() == Pos{1, 4}));
  assert(!r.is_empty());
  assert((Range{Pos{2, 2}, Pos{2, 2}}.is_empty()));

  // edges count as inside
  assert(r.contains_pos(Pos{0, 2}));
  assert(r.contains_pos(Pos{1, 4}));
  assert(r.contains_pos(Pos{0, 9}));
  assert(!r.contains_pos(Pos{0, 1}));
  assert(!r.contains_pos(Pos{1, 5}));

  assert(r.contains_range(Range{Pos{0, 3}, Pos{1, 0}}));
  assert(!r.contains_range(Range{Pos{0, 3}, Pos{2, 0}}));

  Range flipped{Pos{0, 2}, Pos{1, 4}};
  assert(Range::eql(r, flipped));
  assert(!Range::strict_eql(r, flipped));
  assert(Range::strict_eql(r, r));

  // touching ranges overlap
  assert(Range::has_overlap(Range{Pos{0, 0}, Pos{0, 3}}, Range{Pos{0, 3}, Pos{0, 6}}));
  assert(!Range::has_overlap(Range{Pos{0, 0}, Pos{0, 3}}, Range{Pos{0, 4}, Pos{0, 6}}));
  // nesting overlaps in both argument orders
  Range outer{Pos{0, 0}, Pos{0, 9}};
  Range inner{Pos{0, 3}, Pos{0, 4}};
  assert(Range::has_overlap(outer, inner));
  assert(Range::has_overlap(inner, outer));
  return 0;
}

#pragma once
/*
 * Selection
 *
 * Purpose: directional range; cursor is the movable edge, anchor the fixed one.
 * eql ignores direction, strict_eql does not.
 * merge keeps the direction of its first argument.
 */
#include "pos.hpp"
#include "range.hpp"

struct Selection {
  Pos anchor;
  Pos cursor;

  static Selection create_cursor(Pos pos) { return Selection{pos, pos}; }
  bool is_cursor() const { return anchor == cursor; }

  Range to_range() const { return Range{anchor, cursor}; }
  static Selection from_range(const Range& r) { return Selection{r.from, r.to}; }

  Pos before() const { return to_range().before(); }
  Pos after() const { return to_range().after(); }
  bool contains_pos(Pos pos) const { return to_range().contains_pos(pos); }

  static bool eql(const Selection& a, const Selection& b);
  static bool strict_eql(const Selection& a, const Selection& b);
  static bool has_overlap(const Selection& a, const Selection& b);
  // requires a and b not to overlap
  static bool comes_before(const Selection& a, const Selection& b);
  // requires a and b to overlap
  static Selection merge(const Selection& a, const Selection& b);

  bool operator==(const Selection&) const = default;
};

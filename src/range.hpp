#pragma once
/*
 * Range
 *
 * Purpose: unordered pair of positions, no cursor/anchor roles.
 * Rule: containment is edge-inclusive, so ranges that only touch overlap.
 */
#include "pos.hpp"

struct Range {
  Pos from;
  Pos to;

  Pos before() const;
  Pos after() const;
  bool is_empty() const { return from == to; }

  bool contains_pos(Pos pos) const;
  bool contains_range(const Range& other) const;

  static bool eql(const Range& a, const Range& b);
  static bool strict_eql(const Range& a, const Range& b);
  static bool has_overlap(const Range& a, const Range& b);
};

#pragma once
/*
 * Pos / IndexPos
 *
 * Purpose: the two coordinate systems over one buffer.
 *   IndexPos: absolute byte offset, valid in [0, length].
 *   Pos: (row, col), col is a byte offset from the start of the row.
 * Note: Pos::col is not clamped to the row length (virtual column).
 */
#include <compare>
#include <cstddef>

struct IndexPos {
  std::size_t offset = 0;

  static constexpr IndexPos from_int(std::size_t n) { return IndexPos{n}; }
  constexpr std::size_t to_int() const { return offset; }

  constexpr bool comes_before(IndexPos other) const { return offset < other.offset; }
  constexpr bool comes_after(IndexPos other) const { return offset > other.offset; }

  friend constexpr auto operator<=>(const IndexPos&, const IndexPos&) = default;
};

struct Pos {
  std::size_t row = 0;
  std::size_t col = 0;

  constexpr bool comes_before(Pos other) const {
    if (row != other.row) return row < other.row;
    return col < other.col;
  }
  constexpr bool comes_after(Pos other) const { return other.comes_before(*this); }

  // lexicographic: row first, then col
  friend constexpr auto operator<=>(const Pos&, const Pos&) = default;
};

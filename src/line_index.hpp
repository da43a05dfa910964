#pragma once
/*
 * LineIndex
 *
 * Purpose: byte offset where each row starts, rebuilt from the whole buffer.
 * Invariant: never empty, first offset is 0, strictly increasing.
 * Storage: blocks of offsets relative to a block base; reads see one flat sequence.
 */
#include <cstddef>
#include <vector>
#include "config.hpp"
#include "gap_buffer.hpp"
#include "pos.hpp"

struct LineBlock {
  std::size_t base_offset;
  std::vector<std::size_t> rel;
};

class LineIndex {
public:
  LineIndex();

  void build(const GapBuffer& buf);
  std::size_t line_count() const { return count_; }
  IndexPos line_start(std::size_t row) const;
  std::size_t find_row(IndexPos pos) const;
  std::vector<IndexPos> offsets() const;

  std::size_t block_size = FN_LINE_INDEX_BLOCK_SIZE;

private:
  std::vector<LineBlock> blocks_;
  std::size_t count_ = 0;
  std::size_t built_block_size_ = 1;
};

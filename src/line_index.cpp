#include "line_index.hpp"
#include <algorithm>
#include <cassert>

LineIndex::LineIndex() {
  blocks_.push_back(LineBlock{0, {0}});
  count_ = 1;
  built_block_size_ = std::max<std::size_t>(1, block_size);
}

void LineIndex::build(const GapBuffer& buf) {
  blocks_.clear();
  std::size_t len = buf.length();
  std::vector<std::size_t> starts;
  starts.push_back(0);
  for (std::size_t i = 0; i < len; ++i) {
    if (buf.at(i) == '\n') starts.push_back(i + 1);
  }
  std::size_t n = starts.size();
  std::size_t bs = std::max<std::size_t>(1, block_size);
  built_block_size_ = bs;
  for (std::size_t i = 0; i < n; i += bs) {
    std::size_t end = std::min(n, i + bs);
    LineBlock b;
    b.base_offset = starts[i];
    b.rel.reserve(end - i);
    for (std::size_t k = i; k < end; ++k) b.rel.push_back(starts[k] - b.base_offset);
    blocks_.push_back(std::move(b));
  }
  count_ = n;
}

IndexPos LineIndex::line_start(std::size_t row) const {
  assert(row < count_);
  const LineBlock& b = blocks_[row / built_block_size_];
  return IndexPos::from_int(b.base_offset + b.rel[row % built_block_size_]);
}

std::size_t LineIndex::find_row(IndexPos pos) const {
  // last block whose base is <= pos, then last start <= pos inside it
  auto bit = std::upper_bound(blocks_.begin(), blocks_.end(), pos.to_int(),
                              [](std::size_t off, const LineBlock& b) { return off < b.base_offset; });
  assert(bit != blocks_.begin());
  --bit;
  std::size_t rel = pos.to_int() - bit->base_offset;
  auto rit = std::upper_bound(bit->rel.begin(), bit->rel.end(), rel);
  std::size_t in_block = static_cast<std::size_t>(rit - bit->rel.begin()) - 1;
  std::size_t block_idx = static_cast<std::size_t>(bit - blocks_.begin());
  return block_idx * built_block_size_ + in_block;
}

std::vector<IndexPos> LineIndex::offsets() const {
  std::vector<IndexPos> out;
  out.reserve(count_);
  for (const auto& b : blocks_) {
    for (std::size_t r : b.rel) out.push_back(IndexPos::from_int(b.base_offset + r));
  }
  return out;
}

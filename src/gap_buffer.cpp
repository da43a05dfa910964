#include "gap_buffer.hpp"
#include <algorithm>
#include <cassert>

void GapBuffer::clear() { buf_.clear(); gap_start_ = gap_end_ = 0; }

void GapBuffer::assign(std::string_view bytes) {
  buf_.assign(bytes.begin(), bytes.end());
  gap_start_ = gap_end_ = buf_.size();
}

void GapBuffer::ensure_gap(std::size_t need) {
  std::size_t avail = gap_end_ - gap_start_;
  if (avail >= need) return;
  std::size_t grow = need - avail;
  std::size_t new_size = buf_.size() + grow + grow;
  std::vector<char> nb(new_size);
  std::size_t nge = gap_start_ + avail + grow + grow;
  std::copy(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(gap_start_), nb.begin());
  std::copy(buf_.begin() + static_cast<std::ptrdiff_t>(gap_end_), buf_.end(),
            nb.begin() + static_cast<std::ptrdiff_t>(nge));
  buf_.swap(nb);
  gap_end_ = nge;
}

void GapBuffer::move_gap_to(std::size_t pos) {
  if (pos == gap_start_) return;
  if (pos < gap_start_) {
    std::size_t delta = gap_start_ - pos;
    for (std::size_t i = 0; i < delta; ++i) buf_[gap_end_ - 1 - i] = buf_[gap_start_ - 1 - i];
    gap_start_ -= delta; gap_end_ -= delta;
  } else {
    std::size_t delta = pos - gap_start_;
    for (std::size_t i = 0; i < delta; ++i) buf_[gap_start_ + i] = buf_[gap_end_ + i];
    gap_start_ += delta; gap_end_ += delta;
  }
}

void GapBuffer::insert(std::size_t pos, std::string_view bytes) {
  assert(pos <= length());
  if (bytes.empty()) return;
  move_gap_to(pos);
  ensure_gap(bytes.size());
  std::copy(bytes.begin(), bytes.end(), buf_.begin() + static_cast<std::ptrdiff_t>(gap_start_));
  gap_start_ += bytes.size();
}

void GapBuffer::erase(std::size_t pos, std::size_t len) {
  assert(pos + len <= length());
  move_gap_to(pos);
  gap_end_ += len;
}

std::string GapBuffer::slice(std::size_t pos, std::size_t len) const {
  assert(pos + len <= length());
  std::string out;
  out.resize(len);
  for (std::size_t i = 0; i < len; ++i) out[i] = at(pos + i);
  return out;
}

#pragma once
/*
 * GapBuffer
 *
 * Purpose: byte storage for the editor; edits happen in place at the gap.
 * Note: every position is a logical byte offset, the gap is invisible to callers.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

class GapBuffer {
public:
  void clear();
  void assign(std::string_view bytes);
  std::size_t length() const { return buf_.size() - (gap_end_ - gap_start_); }
  std::size_t size() const { return length(); }
  bool empty() const { return length() == 0; }

  char at(std::size_t i) const { return i < gap_start_ ? buf_[i] : buf_[i + (gap_end_ - gap_start_)]; }
  char operator[](std::size_t i) const { return at(i); }

  void insert(std::size_t pos, std::string_view bytes);
  void erase(std::size_t pos, std::size_t len);
  std::string slice(std::size_t pos, std::size_t len) const;
  std::string str() const { return slice(0, length()); }

private:
  void move_gap_to(std::size_t pos);
  void ensure_gap(std::size_t need);

  std::vector<char> buf_;
  std::size_t gap_start_ = 0;
  std::size_t gap_end_ = 0;
};

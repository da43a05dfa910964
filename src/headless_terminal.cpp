#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(0), cols_(0) { resize(rows, cols); }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = std::max(0, rows);
  cols_ = std::max(0, cols);
  cells_.assign(rows_, std::string(cols_, ' '));
  reverse_.assign(rows_, std::vector<bool>(cols_, false));
}

void HeadlessTerminal::clear() {
  for (auto& r : cells_) std::fill(r.begin(), r.end(), ' ');
  for (auto& r : reverse_) std::fill(r.begin(), r.end(), false);
}

void HeadlessTerminal::put(int row, int col, char ch, bool reverse) {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return;
  cells_[row][col] = ch;
  reverse_[row][col] = reverse;
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  for (std::size_t i = 0; i < text.size(); ++i) put(row, col + (int)i, text[i], false);
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    int k = (int)i;
    put(row, col + k, text[i], k >= hl_start && k < hl_start + hl_len);
  }
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  for (int c = std::max(0, col); c < cols_; ++c) put(row, c, ' ', false);
}

std::string HeadlessTerminal::line(int row) const {
  if (row < 0 || row >= rows_) return {};
  std::string s = cells_[row];
  std::size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

bool HeadlessTerminal::is_reversed(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return false;
  return reverse_[row][col];
}

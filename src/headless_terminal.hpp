#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal backed by an in-memory cell grid, for automated tests and
 *          render checks. Out-of-range draws are clipped like a real screen.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { ++refresh_count_; }
  void clear_to_eol(int row, int col) override;

  void resize(int rows, int cols);
  // row contents with trailing spaces removed
  std::string line(int row) const;
  bool is_reversed(int row, int col) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refresh_count() const { return refresh_count_; }
private:
  void put(int row, int col, char ch, bool reverse);

  int rows_;
  int cols_;
  std::vector<std::string> cells_;
  std::vector<std::vector<bool>> reverse_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refresh_count_ = 0;
};

#include "editor.hpp"
#include <algorithm>
#include <utility>

// Every move collapses the selection onto its cursor first. Cursors that end up
// on the same spot are not merged.

void Editor::move_selections_left() {
  for (Selection& s : selections_) {
    Pos c = s.cursor;
    c.col = std::min(c.col, max_col_for_row(c.row));
    if (c.col == 0 && c.row > 0) {
      c.row -= 1;
      c.col = line_content_len(c.row);
    } else if (c.col > 0) {
      c.col -= 1;
    }
    s = Selection::create_cursor(c);
  }
}

void Editor::move_selections_right() {
  const std::size_t last_row = line_count() - 1;
  for (Selection& s : selections_) {
    Pos c = s.cursor;
    c.col += 1;
    if (c.row < last_row && c.col > line_content_len(c.row)) {
      c.row += 1;
      c.col = 0;
    } else if (c.row == last_row) {
      c.col = std::min(c.col, max_col_for_row(c.row));
    }
    s = Selection::create_cursor(c);
  }
}

void Editor::move_selections_up() {
  for (Selection& s : selections_) {
    Pos c = s.cursor;
    if (c.row > 0) {
      c.row -= 1;
      c.col = std::min(c.col, max_col_for_row(c.row));
    }
    s = Selection::create_cursor(c);
  }
}

void Editor::move_selections_down() {
  for (Selection& s : selections_) {
    Pos c = s.cursor;
    if (c.row + 1 < line_count()) {
      c.row += 1;
      c.col = std::min(c.col, max_col_for_row(c.row));
    }
    s = Selection::create_cursor(c);
  }
}

void Editor::move_selections_to_start_of_line() {
  for (Selection& s : selections_) s = Selection::create_cursor(Pos{s.cursor.row, 0});
}

void Editor::move_selections_to_end_of_line() {
  for (Selection& s : selections_) s = Selection::create_cursor(Pos{s.cursor.row, line_content_len(s.cursor.row)});
}

void Editor::move_cursor_before_anchor_for_all_selections() {
  for (Selection& s : selections_) {
    if (!s.cursor.comes_before(s.anchor)) std::swap(s.cursor, s.anchor);
  }
}

void Editor::move_cursor_after_anchor_for_all_selections() {
  for (Selection& s : selections_) {
    if (!s.cursor.comes_after(s.anchor)) std::swap(s.cursor, s.anchor);
  }
}

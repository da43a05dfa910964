#include "headless_terminal.hpp"
#include "renderer.hpp"
#include <cassert>
#include <string>

static Editor make(const std::string& text) {
  Editor e;
  e.insert_text_at_cursors(text);
  e.reset_selections(Selection{});
  return e;
}

int main() {
  HeadlessTerminal term(5, 30);
  Renderer r;

  Editor e = make("012\n456\n890\n");
  View view;
  r.render(term, e, view);
  assert(term.line(0) == "012");
  assert(term.line(1) == "456");
  assert(term.line(2) == "890");
  assert(term.line(3).empty());
  assert(term.line(4).rfind("NORMAL  [no file]  row:1 col:1", 0) == 0);
  assert(term.cursor_row() == 0 && term.cursor_col() == 0);
  assert(term.refresh_count() == 1);

  // selection cells in reverse video, cursor at the selection's cursor edge
  e.reset_selections(Selection{Pos{0, 1}, Pos{0, 3}});
  r.render(term, e, view);
  assert(!term.is_reversed(0, 0));
  assert(term.is_reversed(0, 1));
  assert(term.is_reversed(0, 2));
  assert(!term.is_reversed(0, 3));
  assert(term.cursor_row() == 0 && term.cursor_col() == 3);

  // secondary cursors are marked, the primary one is the terminal cursor
  e.reset_selections(Selection::create_cursor(Pos{1, 1}));
  e.append_selection(Selection::create_cursor(Pos{2, 2}));
  r.render(term, e, view);
  assert(!term.is_reversed(1, 1));
  assert(term.is_reversed(2, 2));
  assert(term.line(4).find("sel:2") != std::string::npos);
  assert(term.cursor_row() == 1 && term.cursor_col() == 1);

  view.show_line_numbers = true;
  view.message = "hello";
  r.render(term, e, view);
  assert(term.line(0) == "1 012");
  assert(term.cursor_col() == 3);
  assert(term.line(4).find("| hello") != std::string::npos);
  view.show_line_numbers = false;

  view.mode = Mode::Command;
  view.cmdline = "wq";
  r.render(term, e, view);
  assert(term.line(4) == ":wq");
  assert(term.cursor_row() == 4 && term.cursor_col() == 3);
  view = View{};

  // tabs expand to the tab width
  Editor tabs = make("\tx\nab\tc");
  view.tab_width = 4;
  tabs.reset_selections(Selection::create_cursor(Pos{0, 1}));
  r.render(term, tabs, view);
  assert(term.line(0) == "    x");
  assert(term.line(1) == "ab  c");
  assert(term.cursor_col() == 4);

  // vertical scrolling keeps the primary cursor visible
  std::string many;
  for (int i = 0; i < 10; ++i) many += "line" + std::to_string(i) + "\n";
  Editor tall = make(many);
  tall.reset_selections(Selection::create_cursor(Pos{8, 0}));
  View tv;
  r.render(term, tall, tv);
  assert(tv.vp.top_line == 5);
  assert(term.line(0) == "line5");
  assert(term.cursor_row() == 3);
  tall.reset_selections(Selection::create_cursor(Pos{2, 0}));
  r.render(term, tall, tv);
  assert(tv.vp.top_line == 2);
  assert(term.line(0) == "line2");

  // horizontal scrolling
  Editor wide = make(std::string(100, 'w') + "END");
  wide.reset_selections(Selection::create_cursor(Pos{0, 103}));
  View wv;
  r.render(term, wide, wv);
  assert(wv.vp.left_col == 103 - 30 + 1);
  assert(term.cursor_col() == 29);
  assert(term.line(0).find("END") != std::string::npos);
  return 0;
}

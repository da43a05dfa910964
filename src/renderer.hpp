#pragma once
/*
 * Renderer
 *
 * Purpose: draw the visible lines, selection highlights, status/command line
 *          and keep the viewport on the primary cursor.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: reads the editor only; the one piece of state it writes is the viewport.
 */
#include <string>
#include "config.hpp"
#include "editor.hpp"
#include "iterminal.hpp"
#include "types.hpp"

struct View {
  Viewport vp;
  Mode mode = Mode::Normal;
  std::string message;
  std::string cmdline;
  bool show_line_numbers = false;
  int tab_width = FN_TAB_WIDTH;
};

class Renderer {
public:
  void render(ITerminal& term, const Editor& ed, View& view);
};

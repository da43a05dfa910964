#include "terminal.hpp"
#include <locale.h>
#include <ncurses.h>
#include <spdlog/spdlog.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  spdlog::debug("terminal up: {}x{}", LINES, COLS);
}

Terminal::~Terminal() {
  endwin();
}

#include "terminal.hpp"
#include <clocale>
#include "iterminal.hpp"

Terminal::Terminal() {
  std::setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  meta(stdscr, TRUE);
  // Esc alone kills the secondary cursors, so do not wait long for a sequence
  set_escdelay(25);
  if (has_colors() && start_color() == OK) {
    short background = use_default_colors() == OK ? -1 : COLOR_BLACK;
    colors_ = init_pair(MC_FOLD_COLOR_PAIR, COLOR_CYAN, background) == OK;
  }
}

Terminal::~Terminal() {
  endwin();
}

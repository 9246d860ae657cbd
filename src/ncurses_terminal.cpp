#include "ncurses_terminal.hpp"
#include <algorithm>

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = static_cast<int>(text.size());
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(hl_len, 0), hl_start, len);
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
  }
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    mvaddnstr(row, col + hl_start, text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
  }
  if (hl_end < len) {
    mvaddnstr(row, col + hl_end, text.c_str() + hl_end, len - hl_end);
  }
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  // monochrome terminals get the marker in bold
  attr_t attr = colors_ ? COLOR_PAIR(color_pair_id) : A_BOLD;
  attron(attr);
  mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
  attroff(attr);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

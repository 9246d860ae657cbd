#pragma once
/*
 * Terminal
 *
 * Purpose: RAII owner of the ncurses session (tty modes and color pairs).
 * Usage: construct in main before any NcursesTerminal; destructor restores the tty.
 * Note: raw mode so Ctrl-Q/Ctrl-S/Ctrl-X reach the editor instead of the tty driver,
 * meta mode so UTF-8 bytes arrive unmasked.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  /* true when the fold marker color pair could be registered */
  bool colors() const { return colors_; }

private:
  bool colors_ = false;
};

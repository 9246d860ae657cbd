#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh).
 * Goal: the renderer draws through it, so ncurses and the headless recorder
 * used by tests are interchangeable.
 * Note: rows and columns are 0-based screen cells.
 */
#include <string>

struct TermSize { int rows; int cols; };

/* color pair used for fold markers */
constexpr int MC_FOLD_COLOR_PAIR = 1;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  /* draws text with [hl_start, hl_start + hl_len) in reverse video */
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
};

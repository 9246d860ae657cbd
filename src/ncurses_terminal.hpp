#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing.
 * Note: initialization/teardown is managed by the Terminal RAII wrapper,
 * which must outlive this object.
 */
#include "iterminal.hpp"
#include "terminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(const Terminal& tty) : colors_(tty.colors()) {}
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;

private:
  bool colors_;
};

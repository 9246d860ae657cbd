#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal that records into an in-memory cell grid instead of a
 * screen, for rendering tests.
 * Note: one byte per cell; attributes are 0 (plain), -1 (reverse) or a color pair id.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refresh_count_++; }
  void clear_to_eol(int row, int col) override;

  /* row contents with trailing blanks removed */
  std::string row_text(int row) const;
  int attr_at(int row, int col) const;
  bool is_highlighted(int row, int col) const { return attr_at(row, col) == -1; }
  int highlighted_count(int row) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refresh_count() const { return refresh_count_; }

private:
  void put(int row, int col, const std::string& text, int attr);

  int rows_;
  int cols_;
  std::vector<std::string> cells_;
  std::vector<std::vector<int>> attrs_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refresh_count_ = 0;
};

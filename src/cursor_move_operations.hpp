#pragma once
/*
 * MoveOperations
 *
 * Purpose: caret movement over a line model (model or view): grapheme steps
 * left/right across line breaks, and vertical moves that remember the
 * intended visible column through leftover columns.
 */
#include "cursor_config.hpp"
#include "cursor_state.hpp"
#include "i_cursor_simple_model.hpp"

struct CursorPosition {
  int line;
  int column;
  int leftover_visible_columns;
};

class MoveOperations {
public:
  static Position left(const ICursorSimpleModel& model, const Position& position);
  static Position right(const ICursorSimpleModel& model, const Position& position);

  static CursorPosition down(const CursorConfiguration& config, const ICursorSimpleModel& model,
                             int line, int column, int leftover_visible_columns, int count, bool allow_move_on_last_line);
  static CursorPosition up(const CursorConfiguration& config, const ICursorSimpleModel& model,
                           int line, int column, int leftover_visible_columns, int count, bool allow_move_on_first_line);

  static SingleCursorState move_left(const ICursorSimpleModel& model, const SingleCursorState& cursor, bool in_selection_mode);
  static SingleCursorState move_right(const ICursorSimpleModel& model, const SingleCursorState& cursor, bool in_selection_mode);
  static SingleCursorState move_up(const CursorConfiguration& config, const ICursorSimpleModel& model,
                                   const SingleCursorState& cursor, bool in_selection_mode, int count);
  static SingleCursorState move_down(const CursorConfiguration& config, const ICursorSimpleModel& model,
                                     const SingleCursorState& cursor, bool in_selection_mode, int count);
  static SingleCursorState move_to_line_start(const ICursorSimpleModel& model, const SingleCursorState& cursor, bool in_selection_mode);
  static SingleCursorState move_to_line_end(const ICursorSimpleModel& model, const SingleCursorState& cursor, bool in_selection_mode);
};

#include "cursor_move_operations.hpp"
#include <algorithm>
#include "strings_util.hpp"

Position MoveOperations::left(const ICursorSimpleModel& model, const Position& position) {
  if (position.column > model.get_line_min_column(position.line)) {
    std::string line = model.get_line_content(position.line);
    return Position(position.line, get_left_delete_offset(position.column - 1, line) + 1);
  }
  if (position.line > 1) {
    int line = position.line - 1;
    return Position(line, model.get_line_max_column(line));
  }
  return position;
}

Position MoveOperations::right(const ICursorSimpleModel& model, const Position& position) {
  if (position.column < model.get_line_max_column(position.line)) {
    std::string line = model.get_line_content(position.line);
    return Position(position.line, position.column + next_char_length(line, position.column - 1));
  }
  if (position.line < model.get_line_count()) {
    return Position(position.line + 1, model.get_line_min_column(position.line + 1));
  }
  return position;
}

CursorPosition MoveOperations::down(const CursorConfiguration& config, const ICursorSimpleModel& model,
                                    int line, int column, int leftover_visible_columns, int count, bool allow_move_on_last_line) {
  int current_visible = config.visible_column_from_column(model, Position(line, column)) + leftover_visible_columns;
  int line_count = model.get_line_count();
  bool was_on_last_line = line == line_count;
  line += count;
  if (line > line_count) {
    line = line_count;
    if (allow_move_on_last_line) column = model.get_line_max_column(line);
    else column = std::min(model.get_line_max_column(line), column);
    if (was_on_last_line) return CursorPosition{line, column, 0};
  } else {
    column = config.column_from_visible_column(model, line, current_visible);
  }
  int leftover = current_visible - config.visible_column_from_column(model, Position(line, column));
  return CursorPosition{line, column, leftover};
}

CursorPosition MoveOperations::up(const CursorConfiguration& config, const ICursorSimpleModel& model,
                                  int line, int column, int leftover_visible_columns, int count, bool allow_move_on_first_line) {
  int current_visible = config.visible_column_from_column(model, Position(line, column)) + leftover_visible_columns;
  bool was_on_first_line = line == 1;
  line -= count;
  if (line < 1) {
    line = 1;
    if (allow_move_on_first_line) column = model.get_line_min_column(line);
    else column = std::min(model.get_line_max_column(line), column);
    if (was_on_first_line) return CursorPosition{line, column, 0};
  } else {
    column = config.column_from_visible_column(model, line, current_visible);
  }
  int leftover = current_visible - config.visible_column_from_column(model, Position(line, column));
  return CursorPosition{line, column, leftover};
}

SingleCursorState MoveOperations::move_left(const ICursorSimpleModel& model, const SingleCursorState& cursor, bool in_selection_mode) {
  Position p;
  if (cursor.has_selection() && !in_selection_mode) {
    // collapse to the selection start
    p = cursor.selection().get_start_position();
  } else {
    p = left(model, cursor.position());
  }
  return cursor.move(in_selection_mode, p.line, p.column, 0);
}

SingleCursorState MoveOperations::move_right(const ICursorSimpleModel& model, const SingleCursorState& cursor, bool in_selection_mode) {
  Position p;
  if (cursor.has_selection() && !in_selection_mode) {
    p = cursor.selection().get_end_position();
  } else {
    p = right(model, cursor.position());
  }
  return cursor.move(in_selection_mode, p.line, p.column, 0);
}

SingleCursorState MoveOperations::move_up(const CursorConfiguration& config, const ICursorSimpleModel& model,
                                          const SingleCursorState& cursor, bool in_selection_mode, int count) {
  int line = cursor.position().line;
  int column = cursor.position().column;
  if (cursor.has_selection() && !in_selection_mode) {
    line = cursor.selection().get_start_position().line;
    column = cursor.selection().get_start_position().column;
  }
  CursorPosition r = up(config, model, line, column, cursor.leftover_visible_columns(), count, true);
  return cursor.move(in_selection_mode, r.line, r.column, r.leftover_visible_columns);
}

SingleCursorState MoveOperations::move_down(const CursorConfiguration& config, const ICursorSimpleModel& model,
                                            const SingleCursorState& cursor, bool in_selection_mode, int count) {
  int line = cursor.position().line;
  int column = cursor.position().column;
  if (cursor.has_selection() && !in_selection_mode) {
    line = cursor.selection().get_end_position().line;
    column = cursor.selection().get_end_position().column;
  }
  CursorPosition r = down(config, model, line, column, cursor.leftover_visible_columns(), count, true);
  return cursor.move(in_selection_mode, r.line, r.column, r.leftover_visible_columns);
}

SingleCursorState MoveOperations::move_to_line_start(const ICursorSimpleModel& model, const SingleCursorState& cursor, bool in_selection_mode) {
  int line = cursor.position().line;
  return cursor.move(in_selection_mode, line, model.get_line_min_column(line), 0);
}

SingleCursorState MoveOperations::move_to_line_end(const ICursorSimpleModel& model, const SingleCursorState& cursor, bool in_selection_mode) {
  int line = cursor.position().line;
  return cursor.move(in_selection_mode, line, model.get_line_max_column(line), 0);
}

#include "cursor_delete_operations.hpp"
#include <algorithm>
#include "cursor_columns.hpp"
#include "cursor_move_operations.hpp"
#include "strings_util.hpp"

std::pair<bool, CommandList> DeleteOperations::delete_right(EditOperationType prev_edit_operation_type,
                                                            const CursorConfiguration&,
                                                            const ICursorSimpleModel& model,
                                                            const std::vector<Selection>& selections) {
  CommandList commands(selections.size());
  bool should_push_stack_element_before = prev_edit_operation_type != EditOperationType::DeletingRight;
  for (size_t i = 0; i < selections.size(); ++i) {
    const Selection& selection = selections[i];
    Range delete_range = selection.range();
    if (delete_range.is_empty()) {
      Position position = selection.get_position();
      Position right_of_position = MoveOperations::right(model, position);
      delete_range = Range(right_of_position, position);
    }
    // caret at the very end of the document
    if (delete_range.is_empty()) continue;
    if (!delete_range.is_single_line()) should_push_stack_element_before = true;
    commands[i] = ReplaceCommand{delete_range, std::string()};
  }
  return {should_push_stack_element_before, commands};
}

bool DeleteOperations::is_auto_closing_pair_delete(AutoClosingEditStrategy auto_closing_delete,
                                                   AutoClosingStrategy auto_closing_brackets,
                                                   AutoClosingStrategy auto_closing_quotes,
                                                   const AutoClosingPairsByChar& auto_closing_pairs_open,
                                                   const ICursorSimpleModel& model,
                                                   const std::vector<Selection>& selections,
                                                   const std::vector<Range>& auto_closed_characters) {
  if (auto_closing_brackets == AutoClosingStrategy::Never && auto_closing_quotes == AutoClosingStrategy::Never) return false;
  if (auto_closing_delete == AutoClosingEditStrategy::Never) return false;

  for (const auto& selection : selections) {
    Position position = selection.get_position();
    if (!selection.is_empty()) return false;

    std::string line_text = model.get_line_content(position.line);
    if (position.column < 2 || position.column >= static_cast<int>(line_text.size()) + 1) return false;
    char character = line_text[static_cast<size_t>(position.column - 2)];

    auto candidates = auto_closing_pairs_open.find(character);
    if (candidates == auto_closing_pairs_open.end()) return false;

    if (is_quote(character)) {
      if (auto_closing_quotes == AutoClosingStrategy::Never) return false;
    } else {
      if (auto_closing_brackets == AutoClosingStrategy::Never) return false;
    }

    char after_character = line_text[static_cast<size_t>(position.column - 1)];
    bool found_pair = false;
    for (const auto& candidate : candidates->second) {
      if (candidate.open == std::string(1, character) && candidate.close == std::string(1, after_character)) found_pair = true;
    }
    if (!found_pair) return false;

    // only pairs the editor inserted itself
    if (auto_closing_delete == AutoClosingEditStrategy::Auto) {
      bool found = std::any_of(auto_closed_characters.begin(), auto_closed_characters.end(), [&](const Range& r) {
        return position.line == r.start.line && position.column == r.start.column;
      });
      if (!found) return false;
    }
  }
  return true;
}

std::pair<bool, CommandList> DeleteOperations::run_auto_closing_pair_delete(const std::vector<Selection>& selections) {
  CommandList commands(selections.size());
  for (size_t i = 0; i < selections.size(); ++i) {
    Position position = selections[i].get_position();
    Range delete_range(position.line, position.column - 1, position.line, position.column + 1);
    commands[i] = ReplaceCommand{delete_range, std::string()};
  }
  return {true, commands};
}

std::pair<bool, CommandList> DeleteOperations::delete_left(EditOperationType prev_edit_operation_type,
                                                           const CursorConfiguration& config,
                                                           const ICursorSimpleModel& model,
                                                           const std::vector<Selection>& selections,
                                                           const std::vector<Range>& auto_closed_characters) {
  if (is_auto_closing_pair_delete(config.auto_closing_delete, config.auto_closing_brackets, config.auto_closing_quotes,
                                  config.auto_closing_pairs.open_by_end, model, selections, auto_closed_characters)) {
    return run_auto_closing_pair_delete(selections);
  }

  CommandList commands(selections.size());
  bool should_push_stack_element_before = prev_edit_operation_type != EditOperationType::DeletingLeft;
  for (size_t i = 0; i < selections.size(); ++i) {
    Range delete_range = get_delete_range(selections[i], model, config);
    // caret at the very start of the document
    if (delete_range.is_empty()) continue;
    if (!delete_range.is_single_line()) should_push_stack_element_before = true;
    commands[i] = ReplaceCommand{delete_range, std::string()};
  }
  return {should_push_stack_element_before, commands};
}

Range DeleteOperations::get_delete_range(const Selection& selection, const ICursorSimpleModel& model, const CursorConfiguration& config) {
  if (!selection.is_empty()) return selection.range();

  Position position = selection.get_position();

  // unindent when using tab stops and the caret is inside the indentation
  if (config.use_tab_stops && position.column > 1) {
    std::string line_content = model.get_line_content(position.line);
    int first_non_whitespace = first_non_whitespace_index(line_content);
    int last_indentation_column = first_non_whitespace == -1
      ? static_cast<int>(line_content.size()) + 1
      : first_non_whitespace + 1;
    if (position.column <= last_indentation_column) {
      int from_visible_column = config.visible_column_from_column(model, position);
      int to_visible_column = prev_indent_tab_stop(from_visible_column, config.indent_size);
      int to_column = config.column_from_visible_column(model, position.line, to_visible_column);
      return Range(position.line, to_column, position.line, position.column);
    }
  }

  return Range::from_positions(get_position_after_delete_left(position, model), position);
}

Position DeleteOperations::get_position_after_delete_left(const Position& position, const ICursorSimpleModel& model) {
  if (position.column > 1) {
    int offset = get_left_delete_offset(position.column - 1, model.get_line_content(position.line));
    return position.with_column(offset + 1);
  }
  if (position.line > 1) {
    int line = position.line - 1;
    return Position(line, model.get_line_max_column(line));
  }
  return position;
}

EditOperationResult DeleteOperations::cut(const CursorConfiguration& config,
                                          const ICursorSimpleModel& model,
                                          std::vector<Selection> selections) {
  EditOperationResult result;
  result.type = EditOperationType::Other;
  result.should_push_stack_element_before = true;
  result.should_push_stack_element_after = true;
  result.commands.resize(selections.size());

  std::stable_sort(selections.begin(), selections.end(), [](const Selection& a, const Selection& b) {
    return Range::compare_ranges_using_starts(a.range(), b.range()) < 0;
  });

  std::optional<Range> last_cut_range;
  std::optional<int> last_cut_line;
  for (size_t i = 0; i < selections.size(); ++i) {
    const Selection& selection = selections[i];
    if (!selection.is_empty()) {
      result.commands[i] = ReplaceCommand{selection.range(), std::string()};
      continue;
    }
    if (!config.empty_selection_clipboard) continue;

    // a full line cut
    Position position = selection.get_position();
    // another caret on a line that is already cut adds nothing
    if (last_cut_line && *last_cut_line == position.line) continue;
    last_cut_line = position.line;
    Range delete_range;
    if (position.line < model.get_line_count()) {
      delete_range = Range(position.line, 1, position.line + 1, 1);
    } else if (position.line > 1 && (!last_cut_range || last_cut_range->end.line != position.line)) {
      // last line: take the newline before it, unless the previous cut already reaches this line
      delete_range = Range(position.line - 1, model.get_line_max_column(position.line - 1),
                           position.line, model.get_line_max_column(position.line));
    } else {
      delete_range = Range(position.line, 1, position.line, model.get_line_max_column(position.line));
    }
    last_cut_range = delete_range;
    if (!delete_range.is_empty()) result.commands[i] = ReplaceCommand{delete_range, std::string()};
  }
  return result;
}

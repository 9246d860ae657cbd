#pragma once
/*
 * DeleteOperations
 *
 * Purpose: compute what backspace, delete and cut remove for every cursor.
 * Pure: reads the model and selections, returns one optional replace-with-""
 * command per selection and whether to open a new undo stop first.
 */
#include <utility>
#include <vector>
#include "cursor_config.hpp"
#include "edit_operation.hpp"
#include "i_cursor_simple_model.hpp"

class DeleteOperations {
public:
  static std::pair<bool, CommandList> delete_right(EditOperationType prev_edit_operation_type,
                                                   const CursorConfiguration& config,
                                                   const ICursorSimpleModel& model,
                                                   const std::vector<Selection>& selections);

  static bool is_auto_closing_pair_delete(AutoClosingEditStrategy auto_closing_delete,
                                          AutoClosingStrategy auto_closing_brackets,
                                          AutoClosingStrategy auto_closing_quotes,
                                          const AutoClosingPairsByChar& auto_closing_pairs_open,
                                          const ICursorSimpleModel& model,
                                          const std::vector<Selection>& selections,
                                          const std::vector<Range>& auto_closed_characters);

  static std::pair<bool, CommandList> delete_left(EditOperationType prev_edit_operation_type,
                                                  const CursorConfiguration& config,
                                                  const ICursorSimpleModel& model,
                                                  const std::vector<Selection>& selections,
                                                  const std::vector<Range>& auto_closed_characters);

  /* commands follow the selections sorted by (start, end), not the input order */
  static EditOperationResult cut(const CursorConfiguration& config,
                                 const ICursorSimpleModel& model,
                                 std::vector<Selection> selections);

private:
  static std::pair<bool, CommandList> run_auto_closing_pair_delete(const std::vector<Selection>& selections);
  static Range get_delete_range(const Selection& selection, const ICursorSimpleModel& model, const CursorConfiguration& config);
  static Position get_position_after_delete_left(const Position& position, const ICursorSimpleModel& model);
};

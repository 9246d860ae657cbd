#include "cursor_state.hpp"

SingleCursorState::SingleCursorState(const Range& selection_start,
                                     SelectionStartKind selection_start_kind,
                                     int selection_start_leftover_visible_columns,
                                     const Position& position,
                                     int leftover_visible_columns)
  : selection_start_(selection_start),
    selection_start_kind_(selection_start_kind),
    selection_start_leftover_visible_columns_(selection_start_leftover_visible_columns),
    position_(position),
    leftover_visible_columns_(leftover_visible_columns),
    selection_(compute_selection(selection_start, position)) {}

SingleCursorState SingleCursorState::at(const Position& p) {
  return SingleCursorState(Range::from_position(p), SelectionStartKind::Simple, 0, p, 0);
}

SingleCursorState SingleCursorState::move(bool in_selection_mode, int line, int column, int leftover_visible_columns) const {
  if (in_selection_mode) {
    return SingleCursorState(selection_start_, selection_start_kind_, selection_start_leftover_visible_columns_,
                             Position(line, column), leftover_visible_columns);
  }
  return SingleCursorState(Range(line, column, line, column), SelectionStartKind::Simple, leftover_visible_columns,
                           Position(line, column), leftover_visible_columns);
}

bool SingleCursorState::equals(const SingleCursorState& other) const {
  return selection_start_kind_ == other.selection_start_kind_
      && selection_start_leftover_visible_columns_ == other.selection_start_leftover_visible_columns_
      && leftover_visible_columns_ == other.leftover_visible_columns_
      && position_ == other.position_
      && selection_start_ == other.selection_start_;
}

Selection SingleCursorState::compute_selection(const Range& selection_start, const Position& position) {
  // anchor at the end of the start range when the caret went before it
  if (selection_start.is_empty() || !position.is_before_or_equal(selection_start.start)) {
    return Selection::from_positions(selection_start.start, position);
  }
  return Selection::from_positions(selection_start.end, position);
}

PartialCursorState CursorState::from_model_state(const SingleCursorState& model_state) {
  return PartialCursorState{model_state, std::nullopt};
}

PartialCursorState CursorState::from_view_state(const SingleCursorState& view_state) {
  return PartialCursorState{std::nullopt, view_state};
}

PartialCursorState CursorState::from_model_selection(const Selection& selection) {
  SingleCursorState model_state(Range::from_position(selection.get_selection_start()), SelectionStartKind::Simple, 0,
                                selection.get_position(), 0);
  return from_model_state(model_state);
}

std::vector<PartialCursorState> CursorState::from_model_selections(const std::vector<Selection>& selections) {
  std::vector<PartialCursorState> states;
  states.reserve(selections.size());
  for (const auto& s : selections) states.push_back(from_model_selection(s));
  return states;
}

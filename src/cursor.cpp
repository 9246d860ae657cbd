#include "cursor.hpp"
#include <glog/logging.h>

Cursor::Cursor(const CursorContext& context)
  : model_state_(SingleCursorState::at(Position(1, 1))),
    view_state_(SingleCursorState::at(Position(1, 1))) {
  set_state(context, model_state_, view_state_);
}

void Cursor::dispose(const CursorContext& context) {
  remove_tracked_range(context);
}

void Cursor::start_tracking_selection(const CursorContext& context) {
  track_selection_ = true;
  update_tracked_range(context);
}

void Cursor::stop_tracking_selection(const CursorContext& context) {
  track_selection_ = false;
  remove_tracked_range(context);
}

void Cursor::update_tracked_range(const CursorContext& context) {
  if (!track_selection_) return;
  sel_tracked_range_ = context.model.set_tracked_range(sel_tracked_range_, model_state_.selection().range(),
                                                       TrackedRangeStickiness::AlwaysGrowsWhenTypingAtEdges);
}

void Cursor::remove_tracked_range(const CursorContext& context) {
  sel_tracked_range_ = context.model.set_tracked_range(sel_tracked_range_, std::nullopt,
                                                       TrackedRangeStickiness::AlwaysGrowsWhenTypingAtEdges);
}

CursorState Cursor::as_cursor_state() const {
  return CursorState{model_state_, view_state_};
}

Selection Cursor::read_selection_from_markers(const CursorContext& context) const {
  CHECK(sel_tracked_range_) << "cursor has no tracked selection";
  std::optional<Range> range = context.model.get_tracked_range(*sel_tracked_range_);
  CHECK(range) << "tracked selection was released behind the cursor's back";
  const Selection& current = model_state_.selection();
  if (current.is_empty() && !range->is_empty()) {
    // a caret must not come back as a selection of the text typed at it
    return Selection::from_range(range->collapse_to_end(), current.get_direction());
  }
  return Selection::from_range(*range, current.get_direction());
}

void Cursor::ensure_valid_state(const CursorContext& context) {
  set_state(context, model_state_, view_state_);
}

Position Cursor::validate_position_with_cache(const ICursorSimpleModel& view_model, const Position& position,
                                              const Position& cache_input, const Position& cache_output) {
  if (position == cache_input) return cache_output;
  return view_model.normalize_position(position, PositionAffinity::None);
}

SingleCursorState Cursor::validate_view_state(const ICursorSimpleModel& view_model, const SingleCursorState& view_state) {
  const Position& position = view_state.position();
  const Position& s_start = view_state.selection_start().start;
  const Position& s_end = view_state.selection_start().end;

  Position valid_position = view_model.normalize_position(position, PositionAffinity::None);
  Position valid_s_start = validate_position_with_cache(view_model, s_start, position, valid_position);
  Position valid_s_end = validate_position_with_cache(view_model, s_end, s_start, valid_s_start);

  if (position == valid_position && s_start == valid_s_start && s_end == valid_s_end) return view_state;

  return SingleCursorState(
    Range::from_positions(valid_s_start, valid_s_end),
    view_state.selection_start_kind(),
    view_state.selection_start_leftover_visible_columns() + s_start.column - valid_s_start.column,
    valid_position,
    view_state.leftover_visible_columns() + position.column - valid_position.column);
}

void Cursor::set_state(const CursorContext& context,
                       const std::optional<SingleCursorState>& model_state_in,
                       const std::optional<SingleCursorState>& view_state_in) {
  CHECK(model_state_in || view_state_in) << "set_state needs a model or a view state";

  std::optional<SingleCursorState> view_state = view_state_in;
  if (view_state) view_state = validate_view_state(context.view_model, *view_state);

  std::optional<SingleCursorState> model_state;
  if (!model_state_in) {
    // only the view state: derive the model state from it
    Range selection_start = context.model.validate_range(
      context.coordinates_converter.convert_view_range_to_model_range(view_state->selection_start()));
    Position position = context.model.validate_position(
      context.coordinates_converter.convert_view_position_to_model_position(view_state->position()));
    model_state.emplace(selection_start, view_state->selection_start_kind(),
                        view_state->selection_start_leftover_visible_columns(), position,
                        view_state->leftover_visible_columns());
  } else {
    const SingleCursorState& in = *model_state_in;
    Range selection_start = context.model.validate_range(in.selection_start());
    int selection_start_leftover = in.selection_start() == selection_start ? in.selection_start_leftover_visible_columns() : 0;
    Position position = context.model.validate_position(in.position());
    int leftover = in.position() == position ? in.leftover_visible_columns() : 0;
    model_state.emplace(selection_start, in.selection_start_kind(), selection_start_leftover, position, leftover);
  }

  if (!view_state) {
    // only the model state: derive the view state from it
    const ICoordinatesConverter& conv = context.coordinates_converter;
    Position view_s_start = conv.convert_model_position_to_view_position(model_state->selection_start().start);
    Position view_s_end = conv.convert_model_position_to_view_position(model_state->selection_start().end);
    Position view_position = conv.convert_model_position_to_view_position(model_state->position());
    view_state.emplace(Range(view_s_start, view_s_end), model_state->selection_start_kind(),
                       model_state->selection_start_leftover_visible_columns(), view_position,
                       model_state->leftover_visible_columns());
  } else {
    Range view_selection_start = context.coordinates_converter.validate_view_range(
      view_state->selection_start(), model_state->selection_start());
    Position view_position = context.coordinates_converter.validate_view_position(
      view_state->position(), model_state->position());
    view_state.emplace(view_selection_start, model_state->selection_start_kind(),
                       model_state->selection_start_leftover_visible_columns(), view_position,
                       model_state->leftover_visible_columns());
  }

  model_state_ = *model_state;
  view_state_ = *view_state;

  update_tracked_range(context);
}

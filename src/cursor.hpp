#pragma once
/*
 * Cursor
 *
 * Purpose: one cursor's selection held twice, in model and in view space,
 * plus the tracked range that keeps the selection glued to its text while
 * the document is edited.
 * Invariant: both states describe the same selection; whichever side is
 * missing on a set_state is derived from the other.
 */
#include <optional>
#include "cursor_context.hpp"
#include "cursor_state.hpp"

class Cursor {
public:
  explicit Cursor(const CursorContext& context);

  const SingleCursorState& model_state() const { return model_state_; }
  const SingleCursorState& view_state() const { return view_state_; }
  bool is_tracking_selection() const { return track_selection_; }
  bool has_tracked_range() const { return sel_tracked_range_.has_value(); }

  void dispose(const CursorContext& context);
  void start_tracking_selection(const CursorContext& context);
  void stop_tracking_selection(const CursorContext& context);
  CursorState as_cursor_state() const;
  Selection read_selection_from_markers(const CursorContext& context) const;
  void ensure_valid_state(const CursorContext& context);
  void set_state(const CursorContext& context,
                 const std::optional<SingleCursorState>& model_state,
                 const std::optional<SingleCursorState>& view_state);

private:
  static Position validate_position_with_cache(const ICursorSimpleModel& view_model, const Position& position,
                                               const Position& cache_input, const Position& cache_output);
  static SingleCursorState validate_view_state(const ICursorSimpleModel& view_model, const SingleCursorState& view_state);
  void update_tracked_range(const CursorContext& context);
  void remove_tracked_range(const CursorContext& context);

  SingleCursorState model_state_;
  SingleCursorState view_state_;
  std::optional<TrackedRangeId> sel_tracked_range_;
  bool track_selection_ = true;
};

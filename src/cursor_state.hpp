#pragma once
/*
 * CursorState
 *
 * Purpose: immutable per-space cursor state and the model/view pair built from it.
 * Note: a state is never edited in place; every change builds a new value.
 */
#include <optional>
#include <vector>
#include "types.hpp"

enum class SelectionStartKind { Simple, Word, Line };

class SingleCursorState {
public:
  SingleCursorState(const Range& selection_start,
                    SelectionStartKind selection_start_kind,
                    int selection_start_leftover_visible_columns,
                    const Position& position,
                    int leftover_visible_columns);

  static SingleCursorState at(const Position& p);

  const Range& selection_start() const { return selection_start_; }
  SelectionStartKind selection_start_kind() const { return selection_start_kind_; }
  int selection_start_leftover_visible_columns() const { return selection_start_leftover_visible_columns_; }
  const Position& position() const { return position_; }
  int leftover_visible_columns() const { return leftover_visible_columns_; }
  const Selection& selection() const { return selection_; }

  bool has_selection() const { return !selection_.is_empty() || !selection_start_.is_empty(); }
  SingleCursorState move(bool in_selection_mode, int line, int column, int leftover_visible_columns) const;
  bool equals(const SingleCursorState& other) const;

private:
  static Selection compute_selection(const Range& selection_start, const Position& position);

  Range selection_start_;
  SelectionStartKind selection_start_kind_;
  int selection_start_leftover_visible_columns_;
  Position position_;
  int leftover_visible_columns_;
  Selection selection_;
};

struct PartialCursorState {
  std::optional<SingleCursorState> model_state;
  std::optional<SingleCursorState> view_state;
};

struct CursorState {
  SingleCursorState model_state;
  SingleCursorState view_state;

  bool equals(const CursorState& other) const {
    return model_state.equals(other.model_state) && view_state.equals(other.view_state);
  }

  static PartialCursorState from_model_state(const SingleCursorState& model_state);
  static PartialCursorState from_view_state(const SingleCursorState& view_state);
  static PartialCursorState from_model_selection(const Selection& selection);
  static std::vector<PartialCursorState> from_model_selections(const std::vector<Selection>& selections);
};

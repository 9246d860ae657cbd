#pragma once
/*
 * CursorCollection
 *
 * Purpose: the ordered cursors of one editor (index 0 is the primary and is
 * never removed), their lifecycle, and normalize(): merging cursors that
 * overlap or touch after an edit.
 * Note: the context is passed to every call, never stored.
 */
#include <optional>
#include <vector>
#include "cursor.hpp"

class CursorCollection {
public:
  explicit CursorCollection(const CursorContext& context);

  void dispose(const CursorContext& context);
  void start_tracking_selections(const CursorContext& context);
  void stop_tracking_selections(const CursorContext& context);
  void ensure_valid_state(const CursorContext& context);
  std::vector<Selection> read_selection_from_markers(const CursorContext& context) const;

  size_t size() const { return cursors_.size(); }
  std::vector<CursorState> get_all() const;
  std::vector<Position> get_view_positions() const;
  Position get_top_most_view_position() const;
  Position get_bottom_most_view_position() const;
  std::vector<Selection> get_selections() const;
  std::vector<Selection> get_view_selections() const;
  CursorState get_primary_cursor() const;
  int get_last_added_cursor_index() const;

  void set_selections(const CursorContext& context, const std::vector<Selection>& selections);
  void set_states(const CursorContext& context, const std::optional<std::vector<PartialCursorState>>& states);
  void kill_secondary_cursors(const CursorContext& context);
  void normalize(const CursorContext& context);

private:
  void set_secondary_states(const CursorContext& context, const std::vector<PartialCursorState>& secondary_states);
  void add_secondary_cursor(const CursorContext& context);
  void remove_secondary_cursor(const CursorContext& context, int remove_index);

  std::vector<Cursor> cursors_;
  /* index into cursors_ of the cursor added or moved last (think Ctrl+click) */
  int last_added_cursor_index_ = 0;
};

#include "cursor_collection.hpp"
#include <algorithm>
#include <glog/logging.h>

CursorCollection::CursorCollection(const CursorContext& context) {
  cursors_.emplace_back(context);
}

void CursorCollection::dispose(const CursorContext& context) {
  for (auto& cursor : cursors_) cursor.dispose(context);
}

void CursorCollection::start_tracking_selections(const CursorContext& context) {
  for (auto& cursor : cursors_) cursor.start_tracking_selection(context);
}

void CursorCollection::stop_tracking_selections(const CursorContext& context) {
  for (auto& cursor : cursors_) cursor.stop_tracking_selection(context);
}

void CursorCollection::ensure_valid_state(const CursorContext& context) {
  for (auto& cursor : cursors_) cursor.ensure_valid_state(context);
}

std::vector<Selection> CursorCollection::read_selection_from_markers(const CursorContext& context) const {
  std::vector<Selection> out;
  out.reserve(cursors_.size());
  for (const auto& cursor : cursors_) out.push_back(cursor.read_selection_from_markers(context));
  return out;
}

std::vector<CursorState> CursorCollection::get_all() const {
  std::vector<CursorState> out;
  out.reserve(cursors_.size());
  for (const auto& cursor : cursors_) out.push_back(cursor.as_cursor_state());
  return out;
}

std::vector<Position> CursorCollection::get_view_positions() const {
  std::vector<Position> out;
  out.reserve(cursors_.size());
  for (const auto& cursor : cursors_) out.push_back(cursor.view_state().position());
  return out;
}

Position CursorCollection::get_top_most_view_position() const {
  const Cursor* best = &cursors_[0];
  for (const auto& cursor : cursors_) {
    if (cursor.view_state().position().is_before(best->view_state().position())) best = &cursor;
  }
  return best->view_state().position();
}

Position CursorCollection::get_bottom_most_view_position() const {
  const Cursor* best = &cursors_[0];
  for (const auto& cursor : cursors_) {
    if (best->view_state().position().is_before_or_equal(cursor.view_state().position())) best = &cursor;
  }
  return best->view_state().position();
}

std::vector<Selection> CursorCollection::get_selections() const {
  std::vector<Selection> out;
  out.reserve(cursors_.size());
  for (const auto& cursor : cursors_) out.push_back(cursor.model_state().selection());
  return out;
}

std::vector<Selection> CursorCollection::get_view_selections() const {
  std::vector<Selection> out;
  out.reserve(cursors_.size());
  for (const auto& cursor : cursors_) out.push_back(cursor.view_state().selection());
  return out;
}

CursorState CursorCollection::get_primary_cursor() const {
  return cursors_[0].as_cursor_state();
}

int CursorCollection::get_last_added_cursor_index() const {
  if (cursors_.size() == 1 || last_added_cursor_index_ == 0) return 0;
  return last_added_cursor_index_;
}

void CursorCollection::set_selections(const CursorContext& context, const std::vector<Selection>& selections) {
  set_states(context, CursorState::from_model_selections(selections));
}

void CursorCollection::set_states(const CursorContext& context, const std::optional<std::vector<PartialCursorState>>& states) {
  if (!states) return;
  CHECK(!states->empty()) << "set_states needs at least the primary cursor's state";
  const PartialCursorState& primary = states->front();
  cursors_[0].set_state(context, primary.model_state, primary.view_state);
  set_secondary_states(context, std::vector<PartialCursorState>(states->begin() + 1, states->end()));
}

void CursorCollection::set_secondary_states(const CursorContext& context, const std::vector<PartialCursorState>& secondary_states) {
  int secondary_cursors = static_cast<int>(cursors_.size()) - 1;
  int wanted = static_cast<int>(secondary_states.size());

  if (secondary_cursors < wanted) {
    for (int i = secondary_cursors; i < wanted; ++i) add_secondary_cursor(context);
  } else if (secondary_cursors > wanted) {
    for (int i = wanted; i < secondary_cursors; ++i) {
      remove_secondary_cursor(context, static_cast<int>(cursors_.size()) - 2);
    }
  }

  for (int i = 0; i < wanted; ++i) {
    const PartialCursorState& s = secondary_states[static_cast<size_t>(i)];
    cursors_[static_cast<size_t>(i + 1)].set_state(context, s.model_state, s.view_state);
  }
}

void CursorCollection::kill_secondary_cursors(const CursorContext& context) {
  set_secondary_states(context, {});
}

void CursorCollection::add_secondary_cursor(const CursorContext& context) {
  cursors_.emplace_back(context);
  last_added_cursor_index_ = static_cast<int>(cursors_.size()) - 1;
}

void CursorCollection::remove_secondary_cursor(const CursorContext& context, int remove_index) {
  if (last_added_cursor_index_ >= remove_index + 1) last_added_cursor_index_--;
  cursors_[static_cast<size_t>(remove_index + 1)].dispose(context);
  cursors_.erase(cursors_.begin() + remove_index + 1);
}

void CursorCollection::normalize(const CursorContext& context) {
  if (cursors_.size() == 1) return;
  if (!context.cursor_config.multi_cursor_merge_overlapping) return;

  struct SortedCursor {
    int index;
    Selection selection;
  };

  // every merge removes a cursor, so rebuild the sorted snapshot and rescan until nothing merges
  for (;;) {
    std::vector<SortedCursor> sorted;
    sorted.reserve(cursors_.size());
    for (size_t i = 0; i < cursors_.size(); ++i) sorted.push_back({static_cast<int>(i), cursors_[i].model_state().selection()});
    std::stable_sort(sorted.begin(), sorted.end(), [](const SortedCursor& a, const SortedCursor& b) {
      return Range::compare_ranges_using_starts(a.selection.range(), b.selection.range()) < 0;
    });

    size_t k = 0;
    for (; k + 1 < sorted.size(); ++k) {
      const Selection& current = sorted[k].selection;
      const Selection& next = sorted[k + 1].selection;
      bool should_merge;
      if (next.is_empty() || current.is_empty()) {
        // carets merge with anything they touch
        should_merge = next.get_start_position().is_before_or_equal(current.get_end_position());
      } else {
        // ranges only merge when they overlap, touching is fine
        should_merge = next.get_start_position().is_before(current.get_end_position());
      }
      if (should_merge) break;
    }
    if (k + 1 >= sorted.size()) return;

    const SortedCursor& winner = sorted[k].index < sorted[k + 1].index ? sorted[k] : sorted[k + 1];
    const SortedCursor& loser = sorted[k].index < sorted[k + 1].index ? sorted[k + 1] : sorted[k];

    if (loser.selection != winner.selection) {
      Range resulting_range = Range::plus_range(loser.selection.range(), winner.selection.range());
      bool loser_ltr = loser.selection.get_selection_start() == loser.selection.get_start_position();
      bool winner_ltr = winner.selection.get_selection_start() == winner.selection.get_start_position();

      bool resulting_ltr;
      if (loser.index == last_added_cursor_index_) {
        resulting_ltr = loser_ltr;
        last_added_cursor_index_ = winner.index;
      } else {
        resulting_ltr = winner_ltr;
      }

      Selection resulting = resulting_ltr ? Selection(resulting_range.start, resulting_range.end)
                                          : Selection(resulting_range.end, resulting_range.start);
      PartialCursorState state = CursorState::from_model_selection(resulting);
      cursors_[static_cast<size_t>(winner.index)].set_state(context, state.model_state, state.view_state);
    }

    VLOG(2) << "normalize: cursor " << loser.index << " " << loser.selection.to_string()
            << " merged into cursor " << winner.index;
    remove_secondary_cursor(context, loser.index - 1);
  }
}

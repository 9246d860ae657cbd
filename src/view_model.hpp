#pragma once
/*
 * ViewModel
 *
 * Purpose: folding view over a TextModel. Implements the view accessor and
 * the coordinate convertor cursors use to keep their view state.
 * Design: hidden line ranges live in the model's tracked-range table so they
 * follow edits; the visible-line index is rebuilt lazily when the model
 * version or the fold set changes.
 * Note: view columns equal model columns (no soft wrapping).
 */
#include <cstdint>
#include <vector>
#include "i_coordinates_converter.hpp"
#include "i_cursor_simple_model.hpp"
#include "text_model.hpp"

class ViewModel : public ICursorSimpleModel, public ICoordinatesConverter {
public:
  explicit ViewModel(TextModel& model);
  ~ViewModel();
  ViewModel(const ViewModel&) = delete;
  ViewModel& operator=(const ViewModel&) = delete;

  /* hides model lines [first_line, last_line]; refused when nothing would stay visible */
  bool hide_lines(int first_line, int last_line);
  void unhide_all();
  std::vector<Range> hidden_areas() const;
  bool is_line_visible(int model_line) const;
  int view_line_to_model_line(int view_line) const;
  /* model lines folded away directly below view_line */
  int hidden_lines_after(int view_line) const;

  int get_line_count() const override;
  std::string get_line_content(int line) const override;
  int get_line_min_column(int line) const override;
  int get_line_max_column(int line) const override;
  Position normalize_position(const Position& position, PositionAffinity affinity) const override;

  Position convert_view_position_to_model_position(const Position& view_position) const override;
  Range convert_view_range_to_model_range(const Range& view_range) const override;
  Position convert_model_position_to_view_position(const Position& model_position) const override;
  Range convert_model_range_to_view_range(const Range& model_range) const override;
  Position validate_view_position(const Position& view_position, const Position& expected_model_position) const override;
  Range validate_view_range(const Range& view_range, const Range& expected_model_range) const override;

private:
  void ensure_fresh() const;
  int clamp_view_line(int view_line) const;

  TextModel& model_;
  std::vector<TrackedRangeId> hidden_;
  uint64_t fold_version_ = 0;
  mutable uint64_t cached_model_version_ = 0;
  mutable uint64_t cached_fold_version_ = UINT64_MAX;
  /* visible_[i] = model line shown on view line i + 1 */
  mutable std::vector<int> visible_;
  /* view_of_[l - 1] = view line of model line l, 0 when hidden */
  mutable std::vector<int> view_of_;
};

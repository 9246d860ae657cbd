#include "view_model.hpp"
#include <algorithm>
#include <glog/logging.h>

ViewModel::ViewModel(TextModel& model) : model_(model) {}

ViewModel::~ViewModel() { unhide_all(); }

/* model lines covered by a hidden range; an end at column 1 of a later line excludes that line */
static bool hidden_span(const Range& r, int& first, int& last) {
  if (r.is_empty()) return false;
  first = r.start.line;
  last = (r.end.column == 1 && r.end.line > r.start.line) ? r.end.line - 1 : r.end.line;
  return first <= last;
}

bool ViewModel::hide_lines(int first_line, int last_line) {
  int count = model_.get_line_count();
  first_line = std::max(first_line, 1);
  last_line = std::min(last_line, count);
  if (first_line > last_line) return false;
  ensure_fresh();
  bool any_left = false;
  for (int l = 1; l <= count && !any_left; ++l) {
    if ((l < first_line || l > last_line) && view_of_[static_cast<size_t>(l - 1)] > 0) any_left = true;
  }
  if (!any_left) return false;
  Position end = last_line < count ? Position(last_line + 1, 1) : Position(last_line, model_.get_line_max_column(last_line));
  Range r(Position(first_line, 1), end);
  if (r.is_empty()) return false;
  auto id = model_.set_tracked_range(std::nullopt, r, TrackedRangeStickiness::NeverGrowsWhenTypingAtEdges);
  hidden_.push_back(*id);
  fold_version_++;
  VLOG(1) << "hide lines " << first_line << ".." << last_line;
  return true;
}

void ViewModel::unhide_all() {
  for (const auto& id : hidden_) {
    model_.set_tracked_range(id, std::nullopt, TrackedRangeStickiness::NeverGrowsWhenTypingAtEdges);
  }
  if (!hidden_.empty()) fold_version_++;
  hidden_.clear();
}

std::vector<Range> ViewModel::hidden_areas() const {
  std::vector<Range> out;
  for (const auto& id : hidden_) {
    auto r = model_.get_tracked_range(id);
    CHECK(r) << "hidden area lost its tracked range";
    int first = 0, last = 0;
    if (hidden_span(*r, first, last)) out.emplace_back(first, 1, last, model_.get_line_max_column(last));
  }
  return out;
}

void ViewModel::ensure_fresh() const {
  if (cached_model_version_ == model_.version_id() && cached_fold_version_ == fold_version_) return;
  int count = model_.get_line_count();
  std::vector<bool> hidden(static_cast<size_t>(count), false);
  for (const auto& id : hidden_) {
    auto r = model_.get_tracked_range(id);
    CHECK(r) << "hidden area lost its tracked range";
    int first = 0, last = 0;
    if (!hidden_span(*r, first, last)) continue;
    for (int l = first; l <= last && l <= count; ++l) hidden[static_cast<size_t>(l - 1)] = true;
  }
  if (std::find(hidden.begin(), hidden.end(), false) == hidden.end()) hidden[0] = false;
  visible_.clear();
  view_of_.assign(static_cast<size_t>(count), 0);
  for (int l = 1; l <= count; ++l) {
    if (hidden[static_cast<size_t>(l - 1)]) continue;
    visible_.push_back(l);
    view_of_[static_cast<size_t>(l - 1)] = static_cast<int>(visible_.size());
  }
  cached_model_version_ = model_.version_id();
  cached_fold_version_ = fold_version_;
}

bool ViewModel::is_line_visible(int model_line) const {
  ensure_fresh();
  if (model_line < 1 || model_line > static_cast<int>(view_of_.size())) return false;
  return view_of_[static_cast<size_t>(model_line - 1)] > 0;
}

int ViewModel::clamp_view_line(int view_line) const {
  return std::clamp(view_line, 1, static_cast<int>(visible_.size()));
}

int ViewModel::view_line_to_model_line(int view_line) const {
  ensure_fresh();
  return visible_[static_cast<size_t>(clamp_view_line(view_line) - 1)];
}

int ViewModel::hidden_lines_after(int view_line) const {
  ensure_fresh();
  int line = clamp_view_line(view_line);
  int next = line < static_cast<int>(visible_.size()) ? visible_[static_cast<size_t>(line)] : model_.get_line_count() + 1;
  return next - visible_[static_cast<size_t>(line - 1)] - 1;
}

int ViewModel::get_line_count() const {
  ensure_fresh();
  return static_cast<int>(visible_.size());
}

std::string ViewModel::get_line_content(int line) const {
  return model_.get_line_content(view_line_to_model_line(line));
}

int ViewModel::get_line_min_column(int) const { return 1; }

int ViewModel::get_line_max_column(int line) const {
  return model_.get_line_max_column(view_line_to_model_line(line));
}

Position ViewModel::normalize_position(const Position& position, PositionAffinity) const {
  ensure_fresh();
  int count = static_cast<int>(visible_.size());
  if (position.line < 1) return Position(1, 1);
  if (position.line > count) return Position(count, get_line_max_column(count));
  int model_line = visible_[static_cast<size_t>(position.line - 1)];
  Position m = model_.validate_position(Position(model_line, position.column));
  return Position(position.line, m.column);
}

Position ViewModel::convert_view_position_to_model_position(const Position& view_position) const {
  ensure_fresh();
  int model_line = visible_[static_cast<size_t>(clamp_view_line(view_position.line) - 1)];
  return model_.validate_position(Position(model_line, view_position.column));
}

Range ViewModel::convert_view_range_to_model_range(const Range& view_range) const {
  return Range(convert_view_position_to_model_position(view_range.start),
               convert_view_position_to_model_position(view_range.end));
}

Position ViewModel::convert_model_position_to_view_position(const Position& model_position) const {
  ensure_fresh();
  Position p = model_.validate_position(model_position);
  int view_line = view_of_[static_cast<size_t>(p.line - 1)];
  if (view_line > 0) return Position(view_line, p.column);
  for (int l = p.line - 1; l >= 1; --l) {
    int v = view_of_[static_cast<size_t>(l - 1)];
    if (v > 0) return Position(v, model_.get_line_max_column(l));
  }
  for (int l = p.line + 1; l <= static_cast<int>(view_of_.size()); ++l) {
    int v = view_of_[static_cast<size_t>(l - 1)];
    if (v > 0) return Position(v, 1);
  }
  return Position(1, 1);
}

Range ViewModel::convert_model_range_to_view_range(const Range& model_range) const {
  return Range(convert_model_position_to_view_position(model_range.start),
               convert_model_position_to_view_position(model_range.end));
}

Position ViewModel::validate_view_position(const Position& view_position, const Position& expected_model_position) const {
  Position valid = normalize_position(view_position, PositionAffinity::None);
  if (convert_view_position_to_model_position(valid) == expected_model_position) return valid;
  return convert_model_position_to_view_position(expected_model_position);
}

Range ViewModel::validate_view_range(const Range& view_range, const Range& expected_model_range) const {
  Position s = normalize_position(view_range.start, PositionAffinity::None);
  Position e = normalize_position(view_range.end, PositionAffinity::None);
  if (convert_view_position_to_model_position(s) == expected_model_range.start
      && convert_view_position_to_model_position(e) == expected_model_range.end) {
    return Range(s, e);
  }
  return convert_model_range_to_view_range(expected_model_range);
}

#include "text_model.hpp"
#include <algorithm>
#include <glog/logging.h>
#include "file_reader.hpp"
#include "strings_util.hpp"

TextModel::TextModel() {}

TextModel::TextModel(const std::string& text) {
  buf_.init_from_lines(split_lines(text.data(), text.size()));
}

TextModel TextModel::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextModel m;
  m.buf_ = TextBuffer::from_file(path, msg, ok);
  if (ok) LOG(INFO) << "loaded " << path.string() << " (" << m.get_line_count() << " lines)";
  return m;
}

bool TextModel::write_file(const std::filesystem::path& path, std::string& msg) const {
  bool ok = buf_.write_file(path, msg);
  if (ok) LOG(INFO) << msg;
  else LOG(WARNING) << msg;
  return ok;
}

std::string TextModel::get_value() const {
  std::string out;
  out.reserve(buf_.byte_size());
  for (int i = 0; i < buf_.line_count(); ++i) {
    if (i > 0) out.push_back('\n');
    out += buf_.line(i);
  }
  return out;
}

std::string TextModel::get_value_in_range(const Range& range) const {
  Range r = validate_range(range);
  const std::string& first = buf_.line(r.start.line - 1);
  if (r.is_single_line()) return first.substr(r.start.column - 1, r.end.column - r.start.column);
  std::string out = first.substr(r.start.column - 1);
  for (int l = r.start.line + 1; l < r.end.line; ++l) {
    out.push_back('\n');
    out += buf_.line(l - 1);
  }
  out.push_back('\n');
  out += buf_.line(r.end.line - 1).substr(0, r.end.column - 1);
  return out;
}

int TextModel::get_line_count() const { return buf_.line_count(); }

std::string TextModel::get_line_content(int line) const {
  if (line < 1 || line > buf_.line_count()) return std::string();
  return buf_.line(line - 1);
}

int TextModel::get_line_min_column(int) const { return 1; }

int TextModel::get_line_max_column(int line) const {
  if (line < 1 || line > buf_.line_count()) return 1;
  return static_cast<int>(buf_.line(line - 1).size()) + 1;
}

Position TextModel::normalize_position(const Position& position, PositionAffinity) const {
  return validate_position(position);
}

Position TextModel::validate_position(const Position& position) const {
  int line_count = buf_.line_count();
  if (position.line < 1) return Position(1, 1);
  if (position.line > line_count) return Position(line_count, get_line_max_column(line_count));
  const std::string& s = buf_.line(position.line - 1);
  int max_column = static_cast<int>(s.size()) + 1;
  int column = std::clamp(position.column, 1, max_column);
  column = code_point_start(s, column - 1) + 1;
  return Position(position.line, column);
}

Range TextModel::validate_range(const Range& range) const {
  Position s = validate_position(range.start);
  Position e = validate_position(range.end);
  if (s == range.start && e == range.end) return range;
  return Range(s, e);
}

bool TextModel::is_live(TrackedRangeId id) const {
  return id.slot < slots_.size() && slots_[id.slot].live && slots_[id.slot].generation == id.generation;
}

std::optional<TrackedRangeId> TextModel::set_tracked_range(std::optional<TrackedRangeId> id,
                                                           const std::optional<Range>& range,
                                                           TrackedRangeStickiness stickiness) {
  if (id) CHECK(is_live(*id)) << "stale tracked range handle " << id->slot << "/" << id->generation;
  if (!range) {
    if (id) {
      slots_[id->slot].live = false;
      free_slots_.push_back(id->slot);
    }
    return std::nullopt;
  }
  if (id) {
    TrackedRangeSlot& slot = slots_[id->slot];
    slot.range = validate_range(*range);
    slot.stickiness = stickiness;
    return id;
  }
  uint32_t index;
  if (!free_slots_.empty()) {
    index = free_slots_.back();
    free_slots_.pop_back();
    slots_[index].generation++;
  } else {
    index = static_cast<uint32_t>(slots_.size());
    slots_.emplace_back();
  }
  TrackedRangeSlot& slot = slots_[index];
  slot.range = validate_range(*range);
  slot.stickiness = stickiness;
  slot.live = true;
  return TrackedRangeId{index, slot.generation};
}

std::optional<Range> TextModel::get_tracked_range(TrackedRangeId id) const {
  if (!is_live(id)) return std::nullopt;
  return slots_[id.slot].range;
}

/* sticks_right: a marker sitting where text is inserted ends up after the inserted text */
static Position adjust_position(const Position& p, const Range& edit, const Position& new_end, bool sticks_right) {
  if (p.is_before(edit.start)) return p;
  if (edit.end.is_before(p)) {
    if (p.line == edit.end.line) return Position(new_end.line, new_end.column + (p.column - edit.end.column));
    return Position(p.line + (new_end.line - edit.end.line), p.column);
  }
  if (p == edit.end && !edit.is_empty()) return new_end;
  return sticks_right ? new_end : edit.start;
}

int TextModel::apply_edits(const std::vector<ReplaceCommand>& edits, std::vector<std::optional<Range>>* results) {
  if (results) results->assign(edits.size(), std::nullopt);
  struct Pending { Range range; const std::string* text; size_t index; };
  std::vector<Pending> sorted;
  sorted.reserve(edits.size());
  for (size_t i = 0; i < edits.size(); ++i) sorted.push_back({validate_range(edits[i].range), &edits[i].text, i});
  std::stable_sort(sorted.begin(), sorted.end(), [](const Pending& a, const Pending& b) {
    return Range::compare_ranges_using_starts(a.range, b.range) < 0;
  });
  std::vector<Pending> kept;
  kept.reserve(sorted.size());
  for (const auto& p : sorted) {
    if (!kept.empty() && p.range.start.is_before(kept.back().range.end)) {
      VLOG(1) << "dropping edit #" << p.index << " " << p.range.to_string()
              << ": overlaps " << kept.back().range.to_string();
      continue;
    }
    kept.push_back(p);
  }
  for (auto it = kept.rbegin(); it != kept.rend(); ++it) {
    Position new_end = replace(it->range, *it->text);
    adjust_tracked_ranges(it->range, new_end);
    if (!results) continue;
    // edits already applied lie after this one; text touching it stays after it
    for (auto done = kept.rbegin(); done != it; ++done) {
      std::optional<Range>& r = (*results)[done->index];
      r = Range(adjust_position(r->start, it->range, new_end, true), adjust_position(r->end, it->range, new_end, true));
    }
    (*results)[it->index] = Range(it->range.start, new_end);
  }
  if (!kept.empty()) version_id_++;
  return static_cast<int>(kept.size());
}

Position TextModel::replace(const Range& range, const std::string& text) {
  std::vector<std::string> parts = split_lines(text.data(), text.size());
  std::string prefix = buf_.line(range.start.line - 1).substr(0, range.start.column - 1);
  std::string suffix = buf_.line(range.end.line - 1).substr(range.end.column - 1);
  Position new_end(range.start.line + static_cast<int>(parts.size()) - 1,
                   parts.size() == 1 ? range.start.column + static_cast<int>(parts[0].size())
                                     : static_cast<int>(parts.back().size()) + 1);
  parts.front() = prefix + parts.front();
  parts.back() += suffix;
  int first_row = range.start.line - 1;
  int removed = range.end.line - range.start.line + 1;
  int common = std::min(removed, static_cast<int>(parts.size()));
  for (int i = 0; i < common; ++i) buf_.replace_line(first_row + i, parts[static_cast<size_t>(i)]);
  if (removed > common) {
    buf_.erase_lines(first_row + common, first_row + removed);
  } else if (static_cast<int>(parts.size()) > common) {
    std::vector<std::string> extra(parts.begin() + common, parts.end());
    buf_.insert_lines(first_row + common, extra);
  }
  return new_end;
}

void TextModel::adjust_tracked_ranges(const Range& edit, const Position& new_end) {
  for (auto& slot : slots_) {
    if (!slot.live) continue;
    bool start_right = false;
    bool end_right = false;
    switch (slot.stickiness) {
      case TrackedRangeStickiness::AlwaysGrowsWhenTypingAtEdges: start_right = false; end_right = true; break;
      case TrackedRangeStickiness::NeverGrowsWhenTypingAtEdges: start_right = true; end_right = false; break;
      case TrackedRangeStickiness::GrowsOnlyWhenTypingBefore: start_right = false; end_right = false; break;
      case TrackedRangeStickiness::GrowsOnlyWhenTypingAfter: start_right = true; end_right = true; break;
    }
    Position s = adjust_position(slot.range.start, edit, new_end, start_right);
    Position e = adjust_position(slot.range.end, edit, new_end, end_right);
    if (e.is_before(s)) e = s;
    slot.range = Range(s, e);
  }
}

#pragma once
/*
 * TextModel
 *
 * Purpose: in-memory document implementing ITextModel: coordinate
 * validation, a tracked-range table adjusted on every edit, and batched
 * application of ReplaceCommands.
 * Note: columns are 1-based byte columns; validation never splits a UTF-8 sequence.
 */
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "edit_operation.hpp"
#include "i_text_model.hpp"
#include "text_buffer.hpp"

class TextModel : public ITextModel {
public:
  TextModel();
  explicit TextModel(const std::string& text);

  static TextModel from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

  std::string get_value() const;
  std::string get_value_in_range(const Range& range) const;
  uint64_t version_id() const { return version_id_; }
  size_t tracked_range_count() const { return slots_.size() - free_slots_.size(); }

  int get_line_count() const override;
  std::string get_line_content(int line) const override;
  int get_line_min_column(int line) const override;
  int get_line_max_column(int line) const override;
  Position normalize_position(const Position& position, PositionAffinity affinity) const override;

  Position validate_position(const Position& position) const override;
  Range validate_range(const Range& range) const override;
  std::optional<TrackedRangeId> set_tracked_range(std::optional<TrackedRangeId> id,
                                                  const std::optional<Range>& range,
                                                  TrackedRangeStickiness stickiness) override;
  std::optional<Range> get_tracked_range(TrackedRangeId id) const override;

  /*
   * applies a batch in one step; edits overlapping an earlier one are dropped. returns edits applied.
   * results, when given, receives per input edit the range its text occupies afterwards (nullopt if dropped).
   */
  int apply_edits(const std::vector<ReplaceCommand>& edits, std::vector<std::optional<Range>>* results = nullptr);

private:
  struct TrackedRangeSlot {
    Range range;
    TrackedRangeStickiness stickiness = TrackedRangeStickiness::AlwaysGrowsWhenTypingAtEdges;
    uint32_t generation = 0;
    bool live = false;
  };

  bool is_live(TrackedRangeId id) const;
  Position replace(const Range& range, const std::string& text);
  void adjust_tracked_ranges(const Range& range, const Position& new_end);

  TextBuffer buf_;
  std::vector<TrackedRangeSlot> slots_;
  std::vector<uint32_t> free_slots_;
  uint64_t version_id_ = 1;
};

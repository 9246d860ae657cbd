#pragma once
/*
 * ITextModel
 *
 * Purpose: document accessor handed to cursors: clamps coordinates and owns
 * the tracked-range table cursors register their selections in.
 * Note: a TrackedRangeId is a weak handle; the model owns the range.
 */
#include <cstdint>
#include <optional>
#include "i_cursor_simple_model.hpp"

enum class TrackedRangeStickiness {
  AlwaysGrowsWhenTypingAtEdges,
  NeverGrowsWhenTypingAtEdges,
  GrowsOnlyWhenTypingBefore,
  GrowsOnlyWhenTypingAfter
};

struct TrackedRangeId {
  uint32_t slot = 0;
  uint32_t generation = 0;
};

inline bool operator==(const TrackedRangeId& a, const TrackedRangeId& b) {
  return a.slot == b.slot && a.generation == b.generation;
}
inline bool operator!=(const TrackedRangeId& a, const TrackedRangeId& b) { return !(a == b); }

class ITextModel : public ICursorSimpleModel {
public:
  virtual Position validate_position(const Position& position) const = 0;
  virtual Range validate_range(const Range& range) const = 0;
  /* existing id + range: update; no id: register; no range: release (returns nullopt). */
  virtual std::optional<TrackedRangeId> set_tracked_range(std::optional<TrackedRangeId> id,
                                                          const std::optional<Range>& range,
                                                          TrackedRangeStickiness stickiness) = 0;
  virtual std::optional<Range> get_tracked_range(TrackedRangeId id) const = 0;
};

#pragma once
/*
 * Types
 *
 * Purpose: coordinate vocabulary shared by every module (Position/Range/Selection).
 * Principle: plain values, 1-based line and column, no knowledge of any document.
 */
#include <string>

struct Position {
  int line = 1;
  int column = 1;

  Position() = default;
  Position(int l, int c) : line(l), column(c) {}

  Position with(int l, int c) const { return Position(l, c); }
  Position with_column(int c) const { return Position(line, c); }
  bool is_before(const Position& other) const;
  bool is_before_or_equal(const Position& other) const;
  static int compare(const Position& a, const Position& b);
  std::string to_string() const;
};

bool operator==(const Position& a, const Position& b);
bool operator!=(const Position& a, const Position& b);
bool operator<(const Position& a, const Position& b);

struct Range {
  Position start;
  Position end;

  Range() = default;
  Range(int start_line, int start_col, int end_line, int end_col);
  Range(const Position& s, const Position& e);

  static Range from_positions(const Position& a, const Position& b);
  static Range from_position(const Position& p) { return Range(p, p); }
  static Range plus_range(const Range& a, const Range& b);
  static int compare_ranges_using_starts(const Range& a, const Range& b);

  bool is_empty() const { return start == end; }
  bool is_single_line() const { return start.line == end.line; }
  bool contains_position(const Position& p) const;
  Range collapse_to_start() const { return Range(start, start); }
  Range collapse_to_end() const { return Range(end, end); }
  std::string to_string() const;
};

bool operator==(const Range& a, const Range& b);
bool operator!=(const Range& a, const Range& b);

enum class SelectionDirection { LTR, RTL };

/*
 * A range with a remembered anchor. `selection_start` is where the selection
 * was started, `position` is where the caret is.
 */
struct Selection {
  Position selection_start;
  Position position;

  Selection() = default;
  Selection(const Position& anchor, const Position& pos) : selection_start(anchor), position(pos) {}
  Selection(int anchor_line, int anchor_col, int line, int col)
    : selection_start(anchor_line, anchor_col), position(line, col) {}

  static Selection from_positions(const Position& anchor, const Position& pos) { return Selection(anchor, pos); }
  static Selection from_range(const Range& r, SelectionDirection dir);

  Position get_start_position() const;
  Position get_end_position() const;
  Position get_position() const { return position; }
  Position get_selection_start() const { return selection_start; }
  Range range() const { return Range::from_positions(selection_start, position); }
  SelectionDirection get_direction() const;
  bool is_empty() const { return selection_start == position; }
  bool is_ltr() const { return get_direction() == SelectionDirection::LTR; }
  std::string to_string() const;
};

bool operator==(const Selection& a, const Selection& b);
bool operator!=(const Selection& a, const Selection& b);

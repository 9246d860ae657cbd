#include "types.hpp"

bool operator==(const Position& a, const Position& b) { return a.line == b.line && a.column == b.column; }
bool operator!=(const Position& a, const Position& b) { return !(a == b); }
bool operator<(const Position& a, const Position& b) { return Position::compare(a, b) < 0; }

bool Position::is_before(const Position& other) const {
  if (line != other.line) return line < other.line;
  return column < other.column;
}

bool Position::is_before_or_equal(const Position& other) const {
  if (line != other.line) return line < other.line;
  return column <= other.column;
}

int Position::compare(const Position& a, const Position& b) {
  if (a.line != b.line) return a.line - b.line;
  return a.column - b.column;
}

std::string Position::to_string() const {
  return "(" + std::to_string(line) + "," + std::to_string(column) + ")";
}

Range::Range(int start_line, int start_col, int end_line, int end_col)
  : Range(Position(start_line, start_col), Position(end_line, end_col)) {}

Range::Range(const Position& s, const Position& e) {
  if (e.is_before(s)) { start = e; end = s; }
  else { start = s; end = e; }
}

Range Range::from_positions(const Position& a, const Position& b) { return Range(a, b); }

Range Range::plus_range(const Range& a, const Range& b) {
  Position s = a.start.is_before(b.start) ? a.start : b.start;
  Position e = b.end.is_before(a.end) ? a.end : b.end;
  return Range(s, e);
}

int Range::compare_ranges_using_starts(const Range& a, const Range& b) {
  int c = Position::compare(a.start, b.start);
  if (c != 0) return c;
  return Position::compare(a.end, b.end);
}

bool Range::contains_position(const Position& p) const {
  return start.is_before_or_equal(p) && p.is_before_or_equal(end);
}

std::string Range::to_string() const {
  return "[" + start.to_string() + " -> " + end.to_string() + ")";
}

bool operator==(const Range& a, const Range& b) { return a.start == b.start && a.end == b.end; }
bool operator!=(const Range& a, const Range& b) { return !(a == b); }

Selection Selection::from_range(const Range& r, SelectionDirection dir) {
  if (dir == SelectionDirection::LTR) return Selection(r.start, r.end);
  return Selection(r.end, r.start);
}

Position Selection::get_start_position() const {
  return position.is_before(selection_start) ? position : selection_start;
}

Position Selection::get_end_position() const {
  return position.is_before(selection_start) ? selection_start : position;
}

SelectionDirection Selection::get_direction() const {
  return get_start_position() == selection_start ? SelectionDirection::LTR : SelectionDirection::RTL;
}

std::string Selection::to_string() const {
  return "[" + selection_start.to_string() + " -> " + position.to_string() + "]";
}

bool operator==(const Selection& a, const Selection& b) {
  return a.selection_start == b.selection_start && a.position == b.position;
}
bool operator!=(const Selection& a, const Selection& b) { return !(a == b); }

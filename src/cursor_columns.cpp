#include "cursor_columns.hpp"
#include <algorithm>
#include "strings_util.hpp"

int next_render_tab_stop(int visible_column, int tab_size) {
  return visible_column + tab_size - visible_column % tab_size;
}

int next_indent_tab_stop(int visible_column, int indent_size) {
  return visible_column + indent_size - visible_column % indent_size;
}

int prev_render_tab_stop(int visible_column, int tab_size) {
  return std::max(0, visible_column - 1 - (visible_column - 1) % tab_size);
}

int prev_indent_tab_stop(int visible_column, int indent_size) {
  return std::max(0, visible_column - 1 - (visible_column - 1) % indent_size);
}

static int next_visible_column(const std::string& line, int offset, int visible_column, int tab_size) {
  if (line[static_cast<size_t>(offset)] == '\t') return next_render_tab_stop(visible_column, tab_size);
  return visible_column + 1;
}

int visible_column_from_column(const std::string& line, int column, int tab_size) {
  int end = std::min(column - 1, static_cast<int>(line.size()));
  int result = 0;
  int offset = 0;
  while (offset < end) {
    int len = next_char_length(line, offset);
    if (len <= 0 || offset + len > end) break;
    result = next_visible_column(line, offset, result, tab_size);
    offset += len;
  }
  return result;
}

int column_from_visible_column(const std::string& line, int visible_column, int tab_size) {
  if (visible_column <= 0) return 1;
  int n = static_cast<int>(line.size());
  int before_visible = 0;
  int before_column = 1;
  int offset = 0;
  while (offset < n) {
    int len = next_char_length(line, offset);
    if (len <= 0) break;
    int after_visible = next_visible_column(line, offset, before_visible, tab_size);
    int after_column = offset + len + 1;
    if (after_visible >= visible_column) {
      int before_delta = visible_column - before_visible;
      int after_delta = after_visible - visible_column;
      return after_delta < before_delta ? after_column : before_column;
    }
    before_visible = after_visible;
    before_column = after_column;
    offset += len;
  }
  return n + 1;
}

#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols),
    cells_(static_cast<size_t>(rows), std::string(static_cast<size_t>(cols), ' ')),
    attrs_(static_cast<size_t>(rows), std::vector<int>(static_cast<size_t>(cols), 0)) {}

void HeadlessTerminal::clear() {
  for (auto& r : cells_) std::fill(r.begin(), r.end(), ' ');
  for (auto& r : attrs_) std::fill(r.begin(), r.end(), 0);
}

void HeadlessTerminal::put(int row, int col, const std::string& text, int attr) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    cells_[static_cast<size_t>(row)][static_cast<size_t>(c)] = text[i];
    attrs_[static_cast<size_t>(row)][static_cast<size_t>(c)] = attr;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, 0); }

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = static_cast<int>(text.size());
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(hl_len, 0), hl_start, len);
  put(row, col, text.substr(0, static_cast<size_t>(hl_start)), 0);
  put(row, col + hl_start, text.substr(static_cast<size_t>(hl_start), static_cast<size_t>(hl_end - hl_start)), -1);
  put(row, col + hl_end, text.substr(static_cast<size_t>(hl_end)), 0);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, color_pair_id);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  put(row, col, std::string(static_cast<size_t>(std::max(0, cols_ - col)), ' '), 0);
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  const std::string& r = cells_[static_cast<size_t>(row)];
  size_t end = r.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : r.substr(0, end + 1);
}

int HeadlessTerminal::attr_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return 0;
  return attrs_[static_cast<size_t>(row)][static_cast<size_t>(col)];
}

int HeadlessTerminal::highlighted_count(int row) const {
  if (row < 0 || row >= rows_) return 0;
  const auto& r = attrs_[static_cast<size_t>(row)];
  return static_cast<int>(std::count(r.begin(), r.end(), -1));
}

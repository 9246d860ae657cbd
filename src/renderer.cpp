#include "renderer.hpp"
#include <algorithm>
#include <sstream>

void Renderer::render(ITerminal& term, const RenderInfo& info, Viewport& vp) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = rows - 1;
  const ViewModel& view = *info.view;
  Position primary = info.selections.empty() ? Position(1, 1) : info.selections[0].get_position();

  if (primary.line < vp.top_line) vp.top_line = primary.line;
  if (primary.line >= vp.top_line + max_text_rows) vp.top_line = primary.line - max_text_rows + 1;
  vp.top_line = std::max(1, vp.top_line);
  int want_col = primary.column - 1;
  if (want_col < vp.left_col) vp.left_col = want_col;
  else if (cols > 0 && want_col >= vp.left_col + cols) vp.left_col = want_col - cols + 1;
  vp.left_col = std::max(0, vp.left_col);

  for (int i = 0; i < max_text_rows; ++i) {
    int view_line = vp.top_line + i;
    if (view_line > view.get_line_count()) break;
    render_line(term, info, i, view_line, vp.left_col, cols);
  }

  std::ostringstream oss;
  oss << (info.file_path ? info.file_path->string() : "[no file]")
      << (info.modified ? " [+]" : "")
      << "  Ln " << view.view_line_to_model_line(primary.line) << ", Col " << primary.column;
  if (info.selections.size() > 1) oss << "  " << info.selections.size() << " cursors";
  if (!info.message.empty()) oss << "  | " << info.message;
  std::string status = oss.str();
  if (static_cast<int>(status.size()) > cols) status.resize(static_cast<size_t>(std::max(0, cols)));
  term.draw_text(rows - 1, 0, status);

  int screen_row = primary.line - vp.top_line;
  if (screen_row >= 0 && screen_row < max_text_rows) {
    int screen_col = std::min(std::max(0, want_col - vp.left_col), std::max(0, cols - 1));
    term.move_cursor(screen_row, screen_col);
  } else {
    term.move_cursor(rows - 1, 0);
  }
  term.refresh();
}

void Renderer::render_line(ITerminal& term, const RenderInfo& info, int row, int view_line, int left_col, int cols) {
  std::string s = info.view->get_line_content(view_line);
  // one cell per byte, tabs shown as a blank; the extra cell is the end-of-line caret slot
  std::replace(s.begin(), s.end(), '\t', ' ');
  s.push_back(' ');
  int len = static_cast<int>(s.size());

  std::vector<char> marked(static_cast<size_t>(len), 0);
  for (size_t k = 0; k < info.selections.size(); ++k) {
    const Selection& sel = info.selections[k];
    Range r = sel.range();
    if (r.start.line > view_line || r.end.line < view_line) continue;
    if (sel.is_empty()) {
      // the terminal cursor shows the primary caret
      if (k == 0) continue;
      int c = std::clamp(r.start.column - 1, 0, len - 1);
      marked[static_cast<size_t>(c)] = 1;
      continue;
    }
    int a = r.start.line == view_line ? r.start.column - 1 : 0;
    int b = r.end.line == view_line ? r.end.column - 1 : len;
    a = std::clamp(a, 0, len);
    b = std::clamp(b, a, len);
    std::fill(marked.begin() + a, marked.begin() + b, 1);
  }

  int start = std::min(left_col, len);
  int end = std::min(len, start + std::max(0, cols));
  int col = 0;
  int p = start;
  while (p < end) {
    int q = p;
    while (q < end && marked[static_cast<size_t>(q)] == marked[static_cast<size_t>(p)]) q++;
    std::string seg = s.substr(static_cast<size_t>(p), static_cast<size_t>(q - p));
    if (marked[static_cast<size_t>(p)]) term.draw_highlighted(row, col, seg, 0, static_cast<int>(seg.size()));
    else term.draw_text(row, col, seg);
    col += q - p;
    p = q;
  }

  int folded = info.view->hidden_lines_after(view_line);
  if (folded > 0 && col + 1 < cols) {
    std::string marker = "+" + std::to_string(folded) + " lines";
    term.draw_colored(row, col + 1, marker, MC_FOLD_COLOR_PAIR);
    col += 1 + static_cast<int>(marker.size());
  }
  term.clear_to_eol(row, col);
}

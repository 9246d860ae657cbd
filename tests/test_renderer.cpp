#include "edit_session.hpp"
#include "headless_terminal.hpp"
#include "renderer.hpp"
#include <cassert>
#include <string>

static RenderInfo info_of(const EditSession& s) {
  RenderInfo info;
  info.view = &s.view_model();
  info.selections = s.cursors().get_view_selections();
  return info;
}

static void run_cursor_tests() {
  EditSession s(TextModel("hello\nworld"));
  s.set_selections({Selection(1, 1, 1, 1), Selection(2, 1, 2, 4)});
  HeadlessTerminal term(6, 40);
  Renderer r;
  Viewport vp;
  r.render(term, info_of(s), vp);
  assert(term.row_text(0) == "hello");
  assert(term.row_text(1) == "world");
  assert(term.highlighted_count(0) == 0);
  assert(term.highlighted_count(1) == 3);
  assert(term.is_highlighted(1, 0));
  assert(!term.is_highlighted(1, 3));
  assert(term.row_text(5) == "[no file]  Ln 1, Col 1  2 cursors");
  assert(term.cursor_row() == 0 && term.cursor_col() == 0);
  assert(term.refresh_count() == 1);

  // secondary carets show as one highlighted cell, the primary as the terminal cursor
  s.set_selections({Selection(1, 3, 1, 3), Selection(2, 2, 2, 2), Selection(2, 6, 2, 6)});
  r.render(term, info_of(s), vp);
  assert(term.highlighted_count(0) == 0);
  assert(term.highlighted_count(1) == 2);
  assert(term.is_highlighted(1, 1));
  assert(term.is_highlighted(1, 5));
  assert(term.cursor_row() == 0 && term.cursor_col() == 2);
  assert(term.row_text(5) == "[no file]  Ln 1, Col 3  3 cursors");

  // a selection across lines covers the line break cell
  s.set_selections({Selection(1, 4, 2, 2)});
  r.render(term, info_of(s), vp);
  assert(term.highlighted_count(0) == 3);
  assert(term.highlighted_count(1) == 1);
  assert(term.cursor_row() == 1 && term.cursor_col() == 1);
  assert(term.row_text(5) == "[no file]  Ln 2, Col 2");
}

static void run_status_tests() {
  EditSession s(TextModel("a"));
  HeadlessTerminal term(3, 60);
  Renderer r;
  Viewport vp;
  RenderInfo info = info_of(s);
  info.file_path = std::filesystem::path("/tmp/notes.txt");
  info.modified = true;
  info.message = "saved";
  r.render(term, info, vp);
  assert(term.row_text(2) == "/tmp/notes.txt [+]  Ln 1, Col 1  | saved");

  HeadlessTerminal narrow(3, 8);
  r.render(narrow, info, vp);
  assert(narrow.row_text(2) == "/tmp/not");
}

static void run_fold_marker_tests() {
  EditSession s(TextModel("fn {\n  a\n  b\n}"));
  std::string msg;
  assert(s.fold_block_at_primary(msg));
  HeadlessTerminal term(5, 40);
  Renderer r;
  Viewport vp;
  r.render(term, info_of(s), vp);
  assert(term.row_text(0) == "fn {  +2 lines");
  assert(term.attr_at(0, 6) == MC_FOLD_COLOR_PAIR);
  assert(term.attr_at(0, 0) == 0);
  assert(term.row_text(1) == "}");
  assert(term.row_text(2).empty());

  // the status line reports the model line under a fold
  s.move_down(false);
  r.render(term, info_of(s), vp);
  assert(term.row_text(4) == "[no file]  Ln 4, Col 1");
  assert(term.cursor_row() == 1);
}

static void run_scroll_tests() {
  std::string text;
  for (int i = 1; i <= 10; ++i) {
    if (i > 1) text += "\n";
    text += "l" + std::to_string(i);
  }
  EditSession s{TextModel(text)};
  s.set_selections({Selection(8, 1, 8, 1)});
  HeadlessTerminal term(5, 20);
  Renderer r;
  Viewport vp;
  r.render(term, info_of(s), vp);
  assert(vp.top_line == 5);
  assert(term.row_text(0) == "l5");
  assert(term.row_text(3) == "l8");
  assert(term.cursor_row() == 3);

  s.set_selections({Selection(2, 1, 2, 1)});
  r.render(term, info_of(s), vp);
  assert(vp.top_line == 2);
  assert(term.row_text(0) == "l2");

  EditSession wide(TextModel("0123456789abcdefghijklmnopqrst"));
  wide.set_selections({Selection(1, 21, 1, 21)});
  HeadlessTerminal small(3, 10);
  Viewport wvp;
  r.render(small, info_of(wide), wvp);
  assert(wvp.left_col == 11);
  assert(small.row_text(0) == "bcdefghijk");
  assert(small.cursor_col() == 9);
}

static void run_tab_tests() {
  EditSession s(TextModel("\tx"));
  HeadlessTerminal term(3, 20);
  Renderer r;
  Viewport vp;
  r.render(term, info_of(s), vp);
  assert(term.row_text(0) == " x");
}

int main() {
  run_cursor_tests();
  run_status_tests();
  run_fold_marker_tests();
  run_scroll_tests();
  run_tab_tests();
  return 0;
}

#include "edit_session.hpp"
#include <cassert>
#include <filesystem>
#include <string>
#include <vector>

static void run_typing_tests() {
  EditSession s(TextModel("ab\ncd\nef"));
  s.set_selections({Selection(1, 3, 1, 3), Selection(2, 3, 2, 3), Selection(3, 3, 3, 3)});
  s.type("x");
  assert(s.model().get_value() == "abx\ncdx\nefx");
  auto sel = s.selections();
  assert(sel.size() == 3);
  assert(sel[0] == Selection(1, 4, 1, 4));
  assert(sel[1] == Selection(2, 4, 2, 4));
  assert(sel[2] == Selection(3, 4, 3, 4));
  assert(s.last_edit_opened_undo_stop());
  s.type("y");
  assert(!s.last_edit_opened_undo_stop());
  assert(s.model().get_value() == "abxy\ncdxy\nefxy");

  // a selection is replaced and the caret lands after the new text
  EditSession r(TextModel("ab\ncd"));
  r.set_selections({Selection(2, 1, 2, 3)});
  r.type("X");
  assert(r.model().get_value() == "ab\nX");
  assert(r.selections()[0] == Selection(2, 2, 2, 2));

  // multi-line text at two carets
  EditSession m(TextModel("a\nb"));
  m.set_selections({Selection(1, 2, 1, 2), Selection(2, 2, 2, 2)});
  m.type("1\n2");
  assert(m.model().get_value() == "a1\n2\nb1\n2");
  assert(m.selections()[0] == Selection(2, 2, 2, 2));
  assert(m.selections()[1] == Selection(4, 2, 4, 2));

  // touching selections each keep a caret after their own text
  EditSession t(TextModel("abcd"));
  t.set_selections({Selection(1, 1, 1, 3), Selection(1, 3, 1, 5)});
  assert(t.cursors().size() == 2);
  t.type("x");
  assert(t.model().get_value() == "xx");
  assert(t.cursors().size() == 2);
  assert(t.selections()[0] == Selection(1, 2, 1, 2));
  assert(t.selections()[1] == Selection(1, 3, 1, 3));

  // an opener typed over selections is not auto-closed
  EditSession p(TextModel("ab"));
  p.set_selections({Selection(1, 1, 1, 2), Selection(1, 2, 1, 3)});
  p.type("(");
  assert(p.model().get_value() == "((");
  assert(p.selections()[0] == Selection(1, 2, 1, 2));
  assert(p.selections()[1] == Selection(1, 3, 1, 3));
}

static void run_undo_grouping_tests() {
  EditSession s(TextModel(""));
  s.type("a");
  assert(s.last_edit_opened_undo_stop());
  s.type(" ");
  assert(s.prev_edit_operation_type() == EditOperationType::TypingFirstSpace);
  assert(s.last_edit_opened_undo_stop());
  s.type(" ");
  assert(s.prev_edit_operation_type() == EditOperationType::TypingConsecutiveSpace);
  assert(!s.last_edit_opened_undo_stop());
  s.type("b");
  assert(!s.last_edit_opened_undo_stop());
  assert(s.model().get_value() == "a  b");

  s.delete_left();
  assert(s.last_edit_opened_undo_stop());
  s.delete_left();
  assert(!s.last_edit_opened_undo_stop());
  assert(s.model().get_value() == "a ");
  assert(s.prev_edit_operation_type() == EditOperationType::DeletingLeft);
}

static void run_auto_close_tests() {
  EditSession s(TextModel(""));
  s.type("(");
  assert(s.model().get_value() == "()");
  assert(s.selections()[0] == Selection(1, 2, 1, 2));
  auto closed = s.auto_closed_characters();
  assert(closed.size() == 1);
  assert(closed[0] == Range(1, 2, 1, 3));

  // typing the closing character steps over it
  s.type(")");
  assert(s.model().get_value() == "()");
  assert(s.selections()[0] == Selection(1, 3, 1, 3));
  assert(s.auto_closed_characters().empty());

  // backspace right after the opener removes the whole pair
  EditSession d(TextModel(""));
  d.type("[");
  d.delete_left();
  assert(d.model().get_value() == "");
  assert(d.selections()[0] == Selection(1, 1, 1, 1));
  assert(d.auto_closed_characters().empty());

  // not before a word
  EditSession w(TextModel("ab"));
  w.type("(");
  assert(w.model().get_value() == "(ab");

  // a quote after a word is an apostrophe
  EditSession q(TextModel("it"));
  q.set_selections({Selection(1, 3, 1, 3)});
  q.type("'");
  assert(q.model().get_value() == "it'");
  q.type(" ");
  q.type("\"");
  assert(q.model().get_value() == "it' \"\"");

  // a closer that was typed by hand is not stepped over
  EditSession h(TextModel(")"));
  h.type(")");
  assert(h.model().get_value() == "))");

  // moving away forgets the auto-closed characters
  EditSession m(TextModel(""));
  m.type("{");
  m.move_left(false);
  assert(m.auto_closed_characters().empty());
  m.move_right(false);
  m.type("}");
  assert(m.model().get_value() == "{}}");

  CursorConfiguration never;
  never.auto_closing_brackets = AutoClosingStrategy::Never;
  EditSession n(TextModel(""), never);
  n.type("(");
  assert(n.model().get_value() == "(");
}

static void run_delete_tests() {
  EditSession s(TextModel("abc"));
  s.set_selections({Selection(1, 2, 1, 2), Selection(1, 3, 1, 3)});
  s.delete_left();
  assert(s.model().get_value() == "c");
  // both carets end up at the start and merge
  assert(s.selections().size() == 1);
  assert(s.selections()[0] == Selection(1, 1, 1, 1));

  EditSession r(TextModel("ab"));
  r.set_selections({Selection(1, 3, 1, 3)});
  uint64_t v = r.model().version_id();
  r.delete_right();
  assert(r.model().version_id() == v);
  r.set_selections({Selection(1, 1, 1, 1)});
  r.delete_right();
  assert(r.model().get_value() == "b");

  EditSession j(TextModel("ab\ncd"));
  j.set_selections({Selection(2, 1, 2, 1)});
  j.delete_left();
  assert(j.model().get_value() == "abcd");
  assert(j.selections()[0] == Selection(1, 3, 1, 3));
}

static void run_cut_tests() {
  EditSession s(TextModel("one\ntwo\nthree"));
  s.set_selections({Selection(2, 2, 2, 2)});
  std::string text = s.cut();
  assert(text == "two\n");
  assert(s.model().get_value() == "one\nthree");
  assert(s.selections()[0] == Selection(2, 1, 2, 1));
  assert(s.last_edit_opened_undo_stop());

  EditSession m(TextModel("hello world"));
  m.set_selections({Selection(1, 1, 1, 6), Selection(1, 7, 1, 12)});
  assert(m.cut() == "hello\nworld");
  assert(m.model().get_value() == " ");
  assert(m.selections().size() == 2);
  assert(m.selections()[0] == Selection(1, 1, 1, 1));
  assert(m.selections()[1] == Selection(1, 2, 1, 2));

  // two carets on one line cut it once
  EditSession twice(TextModel("one\ntwo\nthree"));
  twice.set_selections({Selection(2, 1, 2, 1), Selection(2, 3, 2, 3)});
  assert(twice.cut() == "two\n");
  assert(twice.model().get_value() == "one\nthree");
  assert(twice.cursors().size() == 1);
  assert(twice.selections()[0] == Selection(2, 1, 2, 1));

  EditSession last(TextModel("one\ntwo\nthree"));
  last.set_selections({Selection(3, 1, 3, 1), Selection(3, 4, 3, 4)});
  assert(last.cut() == "\nthree");
  assert(last.model().get_value() == "one\ntwo");
  assert(last.cursors().size() == 1);
  assert(last.selections()[0] == Selection(2, 4, 2, 4));

  CursorConfiguration config;
  config.empty_selection_clipboard = false;
  EditSession e(TextModel("abc"), config);
  assert(e.cut().empty());
  assert(e.model().get_value() == "abc");
}

static void run_add_cursor_tests() {
  EditSession s(TextModel("abcdef\nab\nabcdef"));
  s.set_selections({Selection(1, 5, 1, 5)});
  assert(!s.add_cursor_above());
  assert(s.add_cursor_below());
  assert(s.cursors().size() == 2);
  assert(s.selections()[1] == Selection(2, 3, 2, 3));
  // the remembered column carries over the short line
  assert(s.add_cursor_below());
  assert(s.selections()[2] == Selection(3, 5, 3, 5));
  assert(!s.add_cursor_below());
  assert(s.cursors().size() == 3);

  s.type("X");
  assert(s.model().get_value() == "abcdXef\nabX\nabcdXef");
  s.kill_secondary_cursors();
  assert(s.cursors().size() == 1);
  assert(s.selections()[0] == Selection(1, 6, 1, 6));

  EditSession u(TextModel("a\nb"));
  u.set_selections({Selection(2, 2, 2, 2)});
  assert(u.add_cursor_above());
  assert(u.selections()[1] == Selection(1, 2, 1, 2));
  assert(!u.add_cursor_above());
}

static void run_move_tests() {
  EditSession s(TextModel("ab\ncd"));
  s.set_selections({Selection(1, 3, 1, 3)});
  s.move_right(false);
  assert(s.selections()[0] == Selection(2, 1, 2, 1));
  s.move_to_line_end(true);
  assert(s.selections()[0] == Selection(2, 1, 2, 3));
  s.move_left(false);
  assert(s.selections()[0] == Selection(2, 1, 2, 1));
  s.move_up(false);
  assert(s.selections()[0] == Selection(1, 1, 1, 1));
  s.move_down(true);
  assert(s.selections()[0] == Selection(1, 1, 2, 1));
  s.move_to_line_start(false);
  assert(s.selections()[0] == Selection(2, 1, 2, 1));

  // two carets moving onto the same spot become one
  EditSession m(TextModel("ab"));
  m.set_selections({Selection(1, 1, 1, 1), Selection(1, 2, 1, 2)});
  m.move_left(false);
  assert(m.cursors().size() == 1);
}

static void run_fold_tests() {
  EditSession s(TextModel("fn {\n  a\n  b\n}\nz"));
  std::string msg;
  assert(s.fold_block_at_primary(msg));
  assert(msg == "folded lines 2-3");
  assert(s.view_model().get_line_count() == 3);
  assert(s.view_model().view_line_to_model_line(2) == 4);
  assert(s.view_model().hidden_lines_after(1) == 2);

  // moving down skips the folded lines
  s.move_down(false);
  assert(s.selections()[0] == Selection(4, 1, 4, 1));
  assert(s.cursors().get_view_selections()[0] == Selection(2, 1, 2, 1));

  s.set_selections({Selection(5, 1, 5, 1)});
  assert(!s.fold_block_at_primary(msg));
  assert(msg == "nothing to fold below line 5");

  s.unfold_all();
  assert(s.view_model().get_line_count() == 5);

  // carets inside a new fold move to the line that stays visible
  s.set_selections({Selection(3, 2, 3, 2)});
  assert(s.fold(2, 3));
  assert(s.selections()[0] == Selection(1, 5, 1, 5));
  s.unfold_all();

  EditSession b(TextModel("a\n\nb"));
  b.set_selections({Selection(2, 1, 2, 1)});
  assert(!b.fold_block_at_primary(msg));
  assert(msg == "nothing to fold at line 2");
}

static void run_save_tests() {
  std::filesystem::path p = std::filesystem::temp_directory_path() / "mcursor_test_session.txt";
  EditSession s(TextModel("one\ntwo"));
  s.set_selections({Selection(2, 4, 2, 4)});
  s.type("!");
  std::string msg;
  assert(s.save(p, msg));
  bool ok = false;
  TextModel back = TextModel::from_file(p, msg, ok);
  assert(ok);
  assert(back.get_value() == "one\ntwo!");
  std::filesystem::remove(p);

  assert(!s.save("/nonexistent-dir/x/y.txt", msg));
}

int main() {
  run_typing_tests();
  run_undo_grouping_tests();
  run_auto_close_tests();
  run_delete_tests();
  run_cut_tests();
  run_add_cursor_tests();
  run_move_tests();
  run_fold_tests();
  run_save_tests();
  return 0;
}

#include "cursor_delete_operations.hpp"
#include "text_model.hpp"
#include <cassert>
#include <vector>

static CursorConfiguration default_config() {
  CursorConfiguration c;
  c.tab_size = 4;
  c.indent_size = 4;
  c.use_tab_stops = true;
  return c;
}

static void run_delete_left_tests() {
  CursorConfiguration config = default_config();

  // very start of the document: nothing to delete
  TextModel abc("abc");
  auto r = DeleteOperations::delete_left(EditOperationType::Other, config, abc, {Selection(1, 1, 1, 1)}, {});
  assert(r.second.size() == 1);
  assert(!r.second[0]);
  assert(r.first);
  r = DeleteOperations::delete_left(EditOperationType::DeletingLeft, config, abc, {Selection(1, 1, 1, 1)}, {});
  assert(!r.second[0]);
  assert(!r.first);

  r = DeleteOperations::delete_left(EditOperationType::DeletingLeft, config, abc, {Selection(1, 3, 1, 3)}, {});
  assert(r.second[0]->range == Range(1, 2, 1, 3));
  assert(r.second[0]->text.empty());
  assert(!r.first);

  // a selection is deleted as is
  r = DeleteOperations::delete_left(EditOperationType::Other, config, abc, {Selection(1, 3, 1, 1)}, {});
  assert(r.second[0]->range == Range(1, 1, 1, 3));

  // column 1 joins with the line above and always opens an undo stop
  TextModel two("ab\ncd");
  r = DeleteOperations::delete_left(EditOperationType::DeletingLeft, config, two, {Selection(2, 1, 2, 1)}, {});
  assert(r.second[0]->range == Range(1, 3, 2, 1));
  assert(r.first);
}

static void run_tab_stop_tests() {
  CursorConfiguration config = default_config();

  TextModel four("    x");
  auto r = DeleteOperations::delete_left(EditOperationType::Other, config, four, {Selection(1, 5, 1, 5)}, {});
  assert(r.second[0]->range == Range(1, 1, 1, 5));

  TextModel six("      x");
  r = DeleteOperations::delete_left(EditOperationType::Other, config, six, {Selection(1, 7, 1, 7)}, {});
  assert(r.second[0]->range == Range(1, 5, 1, 7));

  TextModel tab("\tx");
  r = DeleteOperations::delete_left(EditOperationType::Other, config, tab, {Selection(1, 2, 1, 2)}, {});
  assert(r.second[0]->range == Range(1, 1, 1, 2));

  // past the indentation it is a plain one character delete
  TextModel mixed("    xy");
  r = DeleteOperations::delete_left(EditOperationType::Other, config, mixed, {Selection(1, 7, 1, 7)}, {});
  assert(r.second[0]->range == Range(1, 6, 1, 7));

  config.use_tab_stops = false;
  r = DeleteOperations::delete_left(EditOperationType::Other, config, four, {Selection(1, 5, 1, 5)}, {});
  assert(r.second[0]->range == Range(1, 4, 1, 5));
}

static void run_grapheme_tests() {
  CursorConfiguration config = default_config();

  // e + combining acute accent goes as one
  TextModel accent("e\xCC\x81x");
  auto r = DeleteOperations::delete_left(EditOperationType::Other, config, accent, {Selection(1, 4, 1, 4)}, {});
  assert(r.second[0]->range == Range(1, 1, 1, 4));
  auto d = DeleteOperations::delete_right(EditOperationType::Other, config, accent, {Selection(1, 1, 1, 1)});
  assert(d.second[0]->range == Range(1, 1, 1, 4));

  // a regional indicator pair is one flag
  TextModel flag("\xF0\x9F\x87\xAB\xF0\x9F\x87\xB7");
  r = DeleteOperations::delete_left(EditOperationType::Other, config, flag, {Selection(1, 9, 1, 9)}, {});
  assert(r.second[0]->range == Range(1, 1, 1, 9));
}

static void run_delete_right_tests() {
  CursorConfiguration config = default_config();
  TextModel two("ab\ncd");

  auto r = DeleteOperations::delete_right(EditOperationType::DeletingRight, config, two, {Selection(1, 1, 1, 1)});
  assert(r.second[0]->range == Range(1, 1, 1, 2));
  assert(!r.first);

  r = DeleteOperations::delete_right(EditOperationType::DeletingRight, config, two, {Selection(1, 3, 1, 3)});
  assert(r.second[0]->range == Range(1, 3, 2, 1));
  assert(r.first);

  r = DeleteOperations::delete_right(EditOperationType::Other, config, two, {Selection(2, 3, 2, 3), Selection(2, 1, 2, 2)});
  assert(!r.second[0]);
  assert(r.second[1]->range == Range(2, 1, 2, 2));
  assert(r.first);
}

static void run_auto_closing_pair_tests() {
  CursorConfiguration config = default_config();
  config.auto_closing_delete = AutoClosingEditStrategy::Always;
  TextModel parens("()");
  std::vector<Selection> between = {Selection(1, 2, 1, 2)};

  auto r = DeleteOperations::delete_left(EditOperationType::DeletingLeft, config, parens, between, {});
  assert(r.second.size() == 1);
  assert(r.second[0]->range == Range(1, 1, 1, 3));
  assert(r.first);

  // auto mode only deletes pairs the editor inserted
  config.auto_closing_delete = AutoClosingEditStrategy::Auto;
  r = DeleteOperations::delete_left(EditOperationType::Other, config, parens, between, {});
  assert(r.second[0]->range == Range(1, 1, 1, 2));
  r = DeleteOperations::delete_left(EditOperationType::Other, config, parens, between, {Range(1, 2, 1, 3)});
  assert(r.second[0]->range == Range(1, 1, 1, 3));

  const AutoClosingPairsByChar& open = config.auto_closing_pairs.open_by_end;
  assert(DeleteOperations::is_auto_closing_pair_delete(AutoClosingEditStrategy::Always, AutoClosingStrategy::Always,
                                                       AutoClosingStrategy::Always, open, parens, between, {}));
  assert(!DeleteOperations::is_auto_closing_pair_delete(AutoClosingEditStrategy::Never, AutoClosingStrategy::Always,
                                                        AutoClosingStrategy::Always, open, parens, between, {}));
  assert(!DeleteOperations::is_auto_closing_pair_delete(AutoClosingEditStrategy::Always, AutoClosingStrategy::Never,
                                                        AutoClosingStrategy::Always, open, parens, between, {}));
  // a selection or a caret elsewhere disables it for every cursor
  assert(!DeleteOperations::is_auto_closing_pair_delete(AutoClosingEditStrategy::Always, AutoClosingStrategy::Always,
                                                        AutoClosingStrategy::Always, open, parens, {Selection(1, 1, 1, 2)}, {}));
  assert(!DeleteOperations::is_auto_closing_pair_delete(AutoClosingEditStrategy::Always, AutoClosingStrategy::Always,
                                                        AutoClosingStrategy::Always, open, parens,
                                                        {Selection(1, 2, 1, 2), Selection(1, 3, 1, 3)}, {}));

  TextModel quotes("\"\"");
  assert(DeleteOperations::is_auto_closing_pair_delete(AutoClosingEditStrategy::Always, AutoClosingStrategy::Never,
                                                       AutoClosingStrategy::Always, open, quotes, between, {}));
  assert(!DeleteOperations::is_auto_closing_pair_delete(AutoClosingEditStrategy::Always, AutoClosingStrategy::Always,
                                                        AutoClosingStrategy::Never, open, quotes, between, {}));

  TextModel mismatched("(]");
  assert(!DeleteOperations::is_auto_closing_pair_delete(AutoClosingEditStrategy::Always, AutoClosingStrategy::Always,
                                                        AutoClosingStrategy::Always, open, mismatched, between, {}));
}

static void run_cut_tests() {
  CursorConfiguration config = default_config();
  TextModel three("one\ntwo\nthree");

  EditOperationResult r = DeleteOperations::cut(config, three, {Selection(2, 2, 2, 2)});
  assert(r.type == EditOperationType::Other);
  assert(r.should_push_stack_element_before);
  assert(r.should_push_stack_element_after);
  assert(r.commands[0]->range == Range(2, 1, 3, 1));

  // last line takes the newline before it
  r = DeleteOperations::cut(config, three, {Selection(3, 2, 3, 2)});
  assert(r.commands[0]->range == Range(2, 4, 3, 6));

  // unless the previous cut already reached into it
  r = DeleteOperations::cut(config, three, {Selection(3, 1, 3, 1), Selection(2, 1, 2, 1)});
  assert(r.commands[0]->range == Range(2, 1, 3, 1));
  assert(r.commands[1]->range == Range(3, 1, 3, 6));

  // a second caret on an already cut line adds no command
  r = DeleteOperations::cut(config, three, {Selection(2, 3, 2, 3), Selection(2, 1, 2, 1)});
  assert(r.commands[0]->range == Range(2, 1, 3, 1));
  assert(!r.commands[1]);
  r = DeleteOperations::cut(config, three, {Selection(3, 1, 3, 1), Selection(3, 4, 3, 4)});
  assert(r.commands[0]->range == Range(2, 4, 3, 6));
  assert(!r.commands[1]);

  // commands follow the sorted selections
  r = DeleteOperations::cut(config, three, {Selection(3, 1, 3, 3), Selection(1, 2, 1, 1)});
  assert(r.commands[0]->range == Range(1, 1, 1, 2));
  assert(r.commands[1]->range == Range(3, 1, 3, 3));

  TextModel single("abc");
  r = DeleteOperations::cut(config, single, {Selection(1, 2, 1, 2)});
  assert(r.commands[0]->range == Range(1, 1, 1, 4));

  config.empty_selection_clipboard = false;
  r = DeleteOperations::cut(config, three, {Selection(2, 2, 2, 2)});
  assert(!r.commands[0]);
}

int main() {
  run_delete_left_tests();
  run_tab_stop_tests();
  run_grapheme_tests();
  run_delete_right_tests();
  run_auto_closing_pair_tests();
  run_cut_tests();
  return 0;
}

#include "cmd_registry.hpp"
#include "cursor_config.hpp"
#include "text_model.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

static void run_registry_tests() {
  CommandRegistry r;
  std::string seen;
  r.register_command("set width", [&seen](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "bad"; return false; }
    seen = args[0];
    return true;
  });
  std::string msg;
  assert(r.has("set width"));
  assert(r.execute_line("set width=12", msg));
  assert(seen == "12");
  assert(r.execute_line("set width 7", msg));
  assert(seen == "7");
  assert(!r.execute_line("set width", msg));
  assert(msg == "bad");
  assert(!r.execute_line("frobnicate", msg));
  assert(msg == "unknown command: frobnicate");
}

static void run_defaults_tests() {
  CursorConfiguration c;
  assert(c.tab_size == 4);
  assert(c.indent_size == 4);
  assert(c.use_tab_stops);
  assert(c.multi_cursor_merge_overlapping);
  assert(c.empty_selection_clipboard);
  assert(c.auto_closing_brackets == AutoClosingStrategy::LanguageDefined);
  assert(c.auto_closing_delete == AutoClosingEditStrategy::Auto);
  const AutoClosingPair* p = c.auto_closing_pairs.find_by_open('(');
  assert(p && p->close == ")");
  assert(c.auto_closing_pairs.find_by_open('"'));
  assert(!c.auto_closing_pairs.find_by_open('x'));
  assert(c.auto_closing_pairs.close_by_end.count(']') == 1);
  assert(is_quote('`'));
  assert(!is_quote('('));

  TextModel m("\tab");
  assert(c.visible_column_from_column(m, Position(1, 3)) == 5);
  assert(c.column_from_visible_column(m, 1, 4) == 2);
  assert(c.column_from_visible_column(m, 1, 100) == 4);
}

static void run_setting_tests() {
  CursorConfiguration c;
  std::string msg;
  assert(apply_cursor_setting(c, "tabsize", "8", msg));
  assert(c.tab_size == 8);
  assert(!apply_cursor_setting(c, "tabsize", "0", msg));
  assert(msg.find("tabsize") != std::string::npos);
  assert(!apply_cursor_setting(c, "tabsize", "abc", msg));
  assert(c.tab_size == 8);
  assert(!apply_cursor_setting(c, "autoclosedelete", "sometimes", msg));
  assert(!apply_cursor_setting(c, "pairs", "((x", msg));
  // a two-byte character would split into byte pairs
  assert(!apply_cursor_setting(c, "pairs", "\xC2\xAB\xC2\xBB", msg));
  assert(msg.find("ASCII") != std::string::npos);
  assert(c.auto_closing_pairs.find_by_open('('));
  assert(!apply_cursor_setting(c, "nosuch", "1", msg));
  assert(msg == "unknown command: set nosuch");
}

static void run_rc_file_tests() {
  std::filesystem::path p = std::filesystem::temp_directory_path() / "mcursor_test_rc";
  {
    std::ofstream out(p);
    out << "# comment\n"
        << "\" vim style comment\n"
        << "// another\n"
        << "\n"
        << "set tabsize=2\n"
        << ":set indentsize 2\n"
        << "  set usetabstops off  \n"
        << "set autoclosebrackets never\n"
        << "set autoclosequotes beforeWhitespace\n"
        << "set autoclosedelete always\n"
        << "set mergeoverlapping false\n"
        << "set emptyselectionclipboard 0\n"
        << "set pairs <>\n"
        << "set bogus 1\n"
        << "set tabsize\n";
  }
  CursorConfiguration c;
  std::string msg;
  assert(load_cursor_config(p, c, msg));
  assert(c.tab_size == 2);
  assert(c.indent_size == 2);
  assert(!c.use_tab_stops);
  assert(c.auto_closing_brackets == AutoClosingStrategy::Never);
  assert(c.auto_closing_quotes == AutoClosingStrategy::BeforeWhitespace);
  assert(c.auto_closing_delete == AutoClosingEditStrategy::Always);
  assert(!c.multi_cursor_merge_overlapping);
  assert(!c.empty_selection_clipboard);
  assert(c.auto_closing_pairs.find_by_open('<'));
  assert(!c.auto_closing_pairs.find_by_open('('));
  assert(msg == "config " + p.string() + ": 9 applied, 2 skipped (unknown command: set bogus)");
  std::filesystem::remove(p);

  CursorConfiguration untouched;
  assert(!load_cursor_config(p, untouched, msg));
  assert(msg.find("can not open file") == 0);
  assert(untouched.tab_size == 4);

  setenv("HOME", "/tmp/mcursor-home", 1);
  assert(default_rc_path() == std::filesystem::path("/tmp/mcursor-home/.mcursorrc"));
}

int main() {
  run_registry_tests();
  run_defaults_tests();
  run_setting_tests();
  run_rc_file_tests();
  return 0;
}

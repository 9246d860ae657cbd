#pragma once
/*
 * CursorConfiguration
 *
 * Purpose: editing options cursor and delete algorithms consult (tab stops,
 * auto-closing pairs, merge policy, empty-selection clipboard).
 * Loading: defaults from config.hpp, then `set <name> <value>` lines of an rc file.
 */
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "types.hpp"
#include "i_cursor_simple_model.hpp"

enum class AutoClosingStrategy { Always, LanguageDefined, BeforeWhitespace, Never };
enum class AutoClosingEditStrategy { Always, Auto, Never };

struct AutoClosingPair {
  std::string open;
  std::string close;
};

/* candidate pairs keyed by the last character of their opening delimiter */
using AutoClosingPairsByChar = std::map<char, std::vector<AutoClosingPair>>;

struct AutoClosingPairs {
  AutoClosingPairsByChar open_by_end;
  AutoClosingPairsByChar close_by_end;

  static AutoClosingPairs from_pairs(const std::vector<AutoClosingPair>& pairs);
  /* "()[]{}" style list: consecutive characters form open/close pairs */
  static bool parse(const std::string& list, AutoClosingPairs& out);
  const AutoClosingPair* find_by_open(char open) const;
};

bool is_quote(char ch);

struct CursorConfiguration {
  int tab_size;
  int indent_size;
  bool use_tab_stops;
  AutoClosingStrategy auto_closing_brackets = AutoClosingStrategy::LanguageDefined;
  AutoClosingStrategy auto_closing_quotes = AutoClosingStrategy::LanguageDefined;
  AutoClosingEditStrategy auto_closing_delete = AutoClosingEditStrategy::Auto;
  AutoClosingPairs auto_closing_pairs;
  bool multi_cursor_merge_overlapping;
  bool empty_selection_clipboard;

  CursorConfiguration();

  int visible_column_from_column(const ICursorSimpleModel& model, const Position& position) const;
  int column_from_visible_column(const ICursorSimpleModel& model, int line, int visible_column) const;
};

/* applies one `set` setting; false with msg when the name or value is not understood */
bool apply_cursor_setting(CursorConfiguration& config, const std::string& name, const std::string& value, std::string& msg);

/* reads an rc file; false with msg when it cannot be read, bad lines are skipped and reported in msg */
bool load_cursor_config(const std::filesystem::path& path, CursorConfiguration& config, std::string& msg);

std::filesystem::path default_rc_path();

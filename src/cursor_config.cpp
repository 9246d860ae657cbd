#include "cursor_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "cursor_columns.hpp"
#include "file_reader.hpp"

AutoClosingPairs AutoClosingPairs::from_pairs(const std::vector<AutoClosingPair>& pairs) {
  AutoClosingPairs out;
  for (const auto& p : pairs) {
    if (p.open.empty() || p.close.empty()) continue;
    out.open_by_end[p.open.back()].push_back(p);
    out.close_by_end[p.close.back()].push_back(p);
  }
  return out;
}

bool AutoClosingPairs::parse(const std::string& list, AutoClosingPairs& out) {
  if (list.size() % 2 != 0) return false;
  // pairs are single ASCII characters
  for (char ch : list) {
    if (static_cast<unsigned char>(ch) >= 0x80) return false;
  }
  std::vector<AutoClosingPair> pairs;
  for (size_t i = 0; i < list.size(); i += 2) {
    pairs.push_back({std::string(1, list[i]), std::string(1, list[i + 1])});
  }
  out = from_pairs(pairs);
  return true;
}

const AutoClosingPair* AutoClosingPairs::find_by_open(char open) const {
  auto it = open_by_end.find(open);
  if (it == open_by_end.end()) return nullptr;
  for (const auto& p : it->second) {
    if (p.open.size() == 1) return &p;
  }
  return nullptr;
}

bool is_quote(char ch) { return ch == '\'' || ch == '"' || ch == '`'; }

CursorConfiguration::CursorConfiguration()
  : tab_size(MC_DEFAULT_TAB_SIZE),
    indent_size(MC_DEFAULT_INDENT_SIZE),
    use_tab_stops(MC_DEFAULT_USE_TAB_STOPS != 0),
    multi_cursor_merge_overlapping(MC_DEFAULT_MERGE_OVERLAPPING != 0),
    empty_selection_clipboard(MC_DEFAULT_EMPTY_SELECTION_CLIPBOARD != 0) {
  AutoClosingPairs::parse(MC_DEFAULT_AUTO_CLOSING_PAIRS, auto_closing_pairs);
}

int CursorConfiguration::visible_column_from_column(const ICursorSimpleModel& model, const Position& position) const {
  return ::visible_column_from_column(model.get_line_content(position.line), position.column, tab_size);
}

int CursorConfiguration::column_from_visible_column(const ICursorSimpleModel& model, int line, int visible_column) const {
  int result = ::column_from_visible_column(model.get_line_content(line), visible_column, tab_size);
  int min_column = model.get_line_min_column(line);
  if (result < min_column) return min_column;
  int max_column = model.get_line_max_column(line);
  if (result > max_column) return max_column;
  return result;
}

static bool parse_bool(const std::string& s, bool& out) {
  if (s == "on" || s == "true" || s == "1") { out = true; return true; }
  if (s == "off" || s == "false" || s == "0") { out = false; return true; }
  return false;
}

static bool parse_positive(const std::string& s, int& out) {
  if (s.empty()) return false;
  bool digits = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!digits || s.size() > 4) return false;
  int v = std::atoi(s.c_str());
  if (v < 1) return false;
  out = v;
  return true;
}

static bool parse_strategy(const std::string& s, AutoClosingStrategy& out) {
  if (s == "always") { out = AutoClosingStrategy::Always; return true; }
  if (s == "languageDefined") { out = AutoClosingStrategy::LanguageDefined; return true; }
  if (s == "beforeWhitespace") { out = AutoClosingStrategy::BeforeWhitespace; return true; }
  if (s == "never") { out = AutoClosingStrategy::Never; return true; }
  return false;
}

static bool parse_edit_strategy(const std::string& s, AutoClosingEditStrategy& out) {
  if (s == "always") { out = AutoClosingEditStrategy::Always; return true; }
  if (s == "auto") { out = AutoClosingEditStrategy::Auto; return true; }
  if (s == "never") { out = AutoClosingEditStrategy::Never; return true; }
  return false;
}

static void register_settings(CommandRegistry& registry, CursorConfiguration& config) {
  auto one_arg = [](const std::string& name, const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "set " + name + ": expects one value"; return false; }
    return true;
  };
  registry.register_command("set tabsize", [&config, one_arg](const std::vector<std::string>& args, std::string& msg) {
    if (!one_arg("tabsize", args, msg)) return false;
    if (!parse_positive(args[0], config.tab_size)) { msg = "set tabsize: width must be a number >= 1"; return false; }
    return true;
  });
  registry.register_command("set indentsize", [&config, one_arg](const std::vector<std::string>& args, std::string& msg) {
    if (!one_arg("indentsize", args, msg)) return false;
    if (!parse_positive(args[0], config.indent_size)) { msg = "set indentsize: size must be a number >= 1"; return false; }
    return true;
  });
  registry.register_command("set usetabstops", [&config, one_arg](const std::vector<std::string>& args, std::string& msg) {
    if (!one_arg("usetabstops", args, msg)) return false;
    if (!parse_bool(args[0], config.use_tab_stops)) { msg = "set usetabstops: use on|off"; return false; }
    return true;
  });
  registry.register_command("set mergeoverlapping", [&config, one_arg](const std::vector<std::string>& args, std::string& msg) {
    if (!one_arg("mergeoverlapping", args, msg)) return false;
    if (!parse_bool(args[0], config.multi_cursor_merge_overlapping)) { msg = "set mergeoverlapping: use on|off"; return false; }
    return true;
  });
  registry.register_command("set emptyselectionclipboard", [&config, one_arg](const std::vector<std::string>& args, std::string& msg) {
    if (!one_arg("emptyselectionclipboard", args, msg)) return false;
    if (!parse_bool(args[0], config.empty_selection_clipboard)) { msg = "set emptyselectionclipboard: use on|off"; return false; }
    return true;
  });
  registry.register_command("set autoclosebrackets", [&config, one_arg](const std::vector<std::string>& args, std::string& msg) {
    if (!one_arg("autoclosebrackets", args, msg)) return false;
    if (!parse_strategy(args[0], config.auto_closing_brackets)) {
      msg = "set autoclosebrackets: use always|languageDefined|beforeWhitespace|never";
      return false;
    }
    return true;
  });
  registry.register_command("set autoclosequotes", [&config, one_arg](const std::vector<std::string>& args, std::string& msg) {
    if (!one_arg("autoclosequotes", args, msg)) return false;
    if (!parse_strategy(args[0], config.auto_closing_quotes)) {
      msg = "set autoclosequotes: use always|languageDefined|beforeWhitespace|never";
      return false;
    }
    return true;
  });
  registry.register_command("set autoclosedelete", [&config, one_arg](const std::vector<std::string>& args, std::string& msg) {
    if (!one_arg("autoclosedelete", args, msg)) return false;
    if (!parse_edit_strategy(args[0], config.auto_closing_delete)) { msg = "set autoclosedelete: use always|auto|never"; return false; }
    return true;
  });
  registry.register_command("set pairs", [&config, one_arg](const std::vector<std::string>& args, std::string& msg) {
    if (!one_arg("pairs", args, msg)) return false;
    if (!AutoClosingPairs::parse(args[0], config.auto_closing_pairs)) { msg = "set pairs: expects ASCII open/close characters, e.g. ()[]{}"; return false; }
    return true;
  });
}

bool apply_cursor_setting(CursorConfiguration& config, const std::string& name, const std::string& value, std::string& msg) {
  CommandRegistry registry;
  register_settings(registry, config);
  return registry.execute("set " + name, {value}, msg);
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn(static_cast<unsigned char>(s[i]))) i++;
  size_t j = s.size(); while (j > i && isspace_fn(static_cast<unsigned char>(s[j - 1]))) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

bool load_cursor_config(const std::filesystem::path& path, CursorConfiguration& config, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  CommandRegistry registry;
  register_settings(registry, config);
  int applied = 0;
  int skipped = 0;
  std::string first_error;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string s = trim(lines[i]);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::string err;
    if (registry.execute_line(s, err)) {
      applied++;
    } else {
      skipped++;
      LOG(WARNING) << path.string() << ":" << (i + 1) << ": " << err;
      if (first_error.empty()) first_error = err;
    }
  }
  msg = "config " + path.string() + ": " + std::to_string(applied) + " applied";
  if (skipped > 0) msg += ", " + std::to_string(skipped) + " skipped (" + first_error + ")";
  LOG(INFO) << msg;
  return true;
}

std::filesystem::path default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::filesystem::path();
  return std::filesystem::path(home) / MC_RC_FILE_NAME;
}

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <glog/logging.h>
#include "cursor_config.hpp"
#include "edit_session.hpp"
#include "editor.hpp"
#include "ncurses_terminal.hpp"
#include "terminal.hpp"
#include "text_model.hpp"

static void usage(const char* argv0) {
  std::fprintf(stderr, "usage: %s [-c rcfile] [file]\n", argv0);
}

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  // the terminal belongs to the UI; logs go to files only
  FLAGS_logtostderr = false;
  FLAGS_alsologtostderr = false;
  FLAGS_stderrthreshold = google::FATAL;

  std::optional<std::filesystem::path> rc_path;
  std::optional<std::filesystem::path> path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-c") == 0) {
      if (i + 1 >= argc) { usage(argv[0]); return 2; }
      rc_path = std::filesystem::path(argv[++i]);
    } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
      usage(argv[0]);
      return 0;
    } else if (!path) {
      path = std::filesystem::path(argv[i]);
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  std::string message;
  CursorConfiguration config;
  std::error_code ec;
  if (rc_path) {
    if (!load_cursor_config(*rc_path, config, message)) {
      std::fprintf(stderr, "%s\n", message.c_str());
      return 1;
    }
  } else {
    std::filesystem::path p = default_rc_path();
    if (!p.empty() && std::filesystem::exists(p, ec) && !load_cursor_config(p, config, message)) {
      LOG(WARNING) << message;
    }
  }

  TextModel model;
  if (path && std::filesystem::exists(*path, ec)) {
    bool ok = false;
    std::string msg;
    model = TextModel::from_file(*path, msg, ok);
    if (!ok) {
      std::fprintf(stderr, "%s\n", msg.c_str());
      return 1;
    }
  } else if (path) {
    message = "new file: " + path->string();
  }

  LOG(INFO) << "starting on " << (path ? path->string() : std::string("[no file]"));
  Terminal term;
  NcursesTerminal nt(term);
  EditSession session(std::move(model), config);
  Editor ed(nt, session, path, message);
  ed.run();
  return 0;
}

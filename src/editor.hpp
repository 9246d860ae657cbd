#pragma once
/*
 * Editor
 *
 * Purpose: key loop of the mcursor front end. Maps keys to EditSession
 * gestures, keeps the clipboard, the viewport and the status message, and
 * renders through any ITerminal.
 * Note: run() reads keys from ncurses; handle_key() is the testable entry.
 */
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "edit_session.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"

class Editor {
public:
  Editor(ITerminal& term, EditSession& session,
         const std::optional<std::filesystem::path>& file, const std::string& message);

  void run();
  void render();
  void handle_key(int ch);

  bool should_quit() const { return should_quit_; }
  bool modified() const;
  const std::string& message() const { return message_; }
  const std::string& clipboard() const { return clipboard_; }
  const Viewport& viewport() const { return vp_; }

private:
  void save();
  void type_byte(int ch);

  ITerminal& term_;
  EditSession& session_;
  std::optional<std::filesystem::path> file_path_;
  uint64_t saved_version_;
  std::string message_;
  std::string clipboard_;
  /* bytes of a UTF-8 sequence still waiting for its continuation bytes */
  std::string pending_utf8_;
  Renderer renderer_;
  Viewport vp_;
  bool should_quit_ = false;
};

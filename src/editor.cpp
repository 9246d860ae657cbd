#include "editor.hpp"
#include <ncurses.h>
#include <glog/logging.h>

static constexpr int CTRL_d = 4;
static constexpr int CTRL_f = 6;
static constexpr int CTRL_g = 7;
static constexpr int CTRL_h = 8;
static constexpr int CTRL_q = 17;
static constexpr int CTRL_s = 19;
static constexpr int CTRL_u = 21;
static constexpr int CTRL_v = 22;
static constexpr int CTRL_x = 24;
static constexpr int ESC_KEY = 27;
static constexpr int DEL_ASCII = 127;

/* expected length of a UTF-8 sequence from its lead byte, 0 for a stray continuation byte */
static size_t utf8_sequence_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 0;
}

Editor::Editor(ITerminal& term, EditSession& session,
               const std::optional<std::filesystem::path>& file, const std::string& message)
  : term_(term), session_(session), file_path_(file),
    saved_version_(session.model().version_id()), message_(message) {}

bool Editor::modified() const {
  return session_.model().version_id() != saved_version_;
}

void Editor::run() {
  while (!should_quit_) {
    render();
    int ch = getch();
    handle_key(ch);
  }
}

void Editor::render() {
  RenderInfo info;
  info.view = &session_.view_model();
  info.selections = session_.cursors().get_view_selections();
  info.file_path = file_path_;
  info.modified = modified();
  info.message = message_;
  renderer_.render(term_, info, vp_);
}

void Editor::save() {
  if (!file_path_) {
    message_ = "no file name";
    return;
  }
  std::string msg;
  if (session_.save(*file_path_, msg)) saved_version_ = session_.model().version_id();
  message_ = msg;
}

void Editor::type_byte(int ch) {
  unsigned char byte = static_cast<unsigned char>(ch);
  if (pending_utf8_.empty()) {
    size_t need = utf8_sequence_length(byte);
    if (need == 0) return;
    pending_utf8_.push_back(static_cast<char>(byte));
  } else if ((byte & 0xC0) == 0x80) {
    pending_utf8_.push_back(static_cast<char>(byte));
  } else {
    // sequence cut short: drop it and start over with this byte
    pending_utf8_.clear();
    type_byte(ch);
    return;
  }
  if (pending_utf8_.size() < utf8_sequence_length(static_cast<unsigned char>(pending_utf8_[0]))) return;
  session_.type(pending_utf8_);
  pending_utf8_.clear();
}

void Editor::handle_key(int ch) {
  if (ch == ERR) return;
  if (!pending_utf8_.empty() && (ch < 0x80 || ch > 0xFF)) pending_utf8_.clear();
  message_.clear();
  switch (ch) {
    case CTRL_q: should_quit_ = true; break;
    case CTRL_s: save(); break;
    case KEY_LEFT: session_.move_left(false); break;
    case KEY_RIGHT: session_.move_right(false); break;
    case KEY_UP: session_.move_up(false); break;
    case KEY_DOWN: session_.move_down(false); break;
    case KEY_SLEFT: session_.move_left(true); break;
    case KEY_SRIGHT: session_.move_right(true); break;
    case KEY_SR: session_.move_up(true); break;
    case KEY_SF: session_.move_down(true); break;
    case KEY_HOME: session_.move_to_line_start(false); break;
    case KEY_END: session_.move_to_line_end(false); break;
    case CTRL_d:
      if (!session_.add_cursor_below()) message_ = "no line below";
      break;
    case CTRL_u:
      if (!session_.add_cursor_above()) message_ = "no line above";
      break;
    case ESC_KEY: session_.kill_secondary_cursors(); break;
    case KEY_BACKSPACE: case DEL_ASCII: case CTRL_h: session_.delete_left(); break;
    case KEY_DC: session_.delete_right(); break;
    case CTRL_x: {
      std::string text = session_.cut();
      if (!text.empty()) clipboard_ = text;
    } break;
    case CTRL_v:
      if (clipboard_.empty()) message_ = "clipboard is empty";
      else session_.type(clipboard_);
      break;
    case CTRL_f: {
      std::string msg;
      session_.fold_block_at_primary(msg);
      message_ = msg;
    } break;
    case CTRL_g: session_.unfold_all(); break;
    case '\n': case '\r': case KEY_ENTER: session_.type("\n"); break;
    case '\t': session_.type("\t"); break;
    default:
      if (ch >= 32 && ch <= 0xFF) {
        type_byte(ch);
      } else {
        VLOG(1) << "unbound key " << ch;
      }
      break;
  }
}

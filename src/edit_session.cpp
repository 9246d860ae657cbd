#include "edit_session.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include <glog/logging.h>
#include "cursor_delete_operations.hpp"
#include "cursor_move_operations.hpp"
#include "strings_util.hpp"

static bool is_typing(EditOperationType type) {
  return type == EditOperationType::TypingOther
      || type == EditOperationType::TypingFirstSpace
      || type == EditOperationType::TypingConsecutiveSpace;
}

static EditOperationType normalize_operation_type(EditOperationType type) {
  return type == EditOperationType::TypingConsecutiveSpace ? EditOperationType::TypingOther : type;
}

static bool should_push_stack_element_between(EditOperationType previous, EditOperationType next) {
  if (is_typing(previous) && !is_typing(next)) return true;
  if (previous == EditOperationType::TypingFirstSpace) return false;
  return normalize_operation_type(previous) != normalize_operation_type(next);
}

EditSession::EditSession(TextModel model, CursorConfiguration config)
  : model_(std::move(model)),
    view_(model_),
    config_(std::move(config)),
    cursors_(context()) {}

EditSession::~EditSession() {
  clear_auto_closed();
  cursors_.dispose(context());
}

CursorContext EditSession::context() {
  return CursorContext{model_, view_, view_, config_};
}

std::vector<Range> EditSession::auto_closed_characters() const {
  std::vector<Range> out;
  for (const auto& id : auto_closed_) {
    std::optional<Range> r = model_.get_tracked_range(id);
    if (r) out.push_back(*r);
  }
  return out;
}

void EditSession::set_selections(const std::vector<Selection>& selections) {
  CursorContext ctx = context();
  cursors_.set_selections(ctx, selections);
  cursors_.normalize(ctx);
  clear_auto_closed();
  prev_edit_operation_type_ = EditOperationType::Other;
}

void EditSession::execute_commands(EditOperationType type, bool push_stack_element_before, const CommandList& commands,
                                   bool place_after_text, int back_columns) {
  last_push_stack_element_before_ = push_stack_element_before;
  prev_edit_operation_type_ = type;

  std::vector<ReplaceCommand> batch;
  for (const auto& command : commands) {
    if (command) batch.push_back(*command);
  }
  if (batch.empty()) return;

  std::vector<std::optional<Range>> results;
  int applied = model_.apply_edits(batch, &results);
  VLOG(1) << "applied " << applied << "/" << batch.size() << " edits";

  CursorContext ctx = context();
  std::vector<Selection> selections = cursors_.read_selection_from_markers(ctx);
  if (place_after_text) {
    // each caret goes after its own command's text; a neighbour's marker may have grown over it
    size_t k = 0;
    for (size_t i = 0; i < selections.size() && i < commands.size(); ++i) {
      if (!commands[i]) continue;
      const std::optional<Range>& inserted = results[k++];
      if (!inserted) continue;
      Position caret = inserted->end.with_column(std::max(1, inserted->end.column - back_columns));
      selections[i] = Selection(caret, caret);
    }
  }
  cursors_.set_selections(ctx, selections);
  cursors_.normalize(ctx);
  prune_auto_closed();
}

bool EditSession::should_auto_close(char ch) const {
  AutoClosingStrategy strategy = is_quote(ch) ? config_.auto_closing_quotes : config_.auto_closing_brackets;
  if (strategy == AutoClosingStrategy::Never) return false;

  for (const auto& selection : cursors_.get_selections()) {
    if (!selection.is_empty()) return false;
    Position position = selection.get_position();
    std::string line = model_.get_line_content(position.line);
    size_t after = static_cast<size_t>(position.column - 1);
    if (after < line.size()) {
      unsigned char next = static_cast<unsigned char>(line[after]);
      if (strategy == AutoClosingStrategy::BeforeWhitespace && !std::isspace(next)) return false;
      if (strategy == AutoClosingStrategy::LanguageDefined && !std::isspace(next)
          && std::string(";:.,=}])>").find(static_cast<char>(next)) == std::string::npos) {
        return false;
      }
    }
    // a quote right after a word is an apostrophe, not an opening quote
    if (is_quote(ch) && position.column > 1) {
      unsigned char prev = static_cast<unsigned char>(line[after - 1]);
      if (std::isalnum(prev) || prev == '_') return false;
    }
  }
  return true;
}

bool EditSession::try_overtype(const std::string& text) {
  if (text.size() != 1 || auto_closed_.empty()) return false;

  std::vector<Selection> selections = cursors_.get_selections();
  std::vector<TrackedRangeId> consumed;
  for (const auto& selection : selections) {
    if (!selection.is_empty()) return false;
    bool hit = false;
    for (const auto& id : auto_closed_) {
      std::optional<Range> r = model_.get_tracked_range(id);
      if (r && r->start == selection.get_position() && model_.get_value_in_range(*r) == text) {
        consumed.push_back(id);
        hit = true;
        break;
      }
    }
    if (!hit) return false;
  }

  for (auto& selection : selections) {
    Position caret = selection.get_position().with_column(selection.get_position().column + 1);
    selection = Selection(caret, caret);
  }
  for (const auto& id : consumed) release_auto_closed(id);

  CursorContext ctx = context();
  cursors_.set_selections(ctx, selections);
  cursors_.normalize(ctx);
  last_push_stack_element_before_ = false;
  prev_edit_operation_type_ = EditOperationType::TypingOther;
  return true;
}

void EditSession::type(const std::string& text) {
  if (text.empty()) return;
  if (try_overtype(text)) return;

  EditOperationType op_type = EditOperationType::TypingOther;
  if (text == " ") {
    op_type = (prev_edit_operation_type_ == EditOperationType::TypingFirstSpace
            || prev_edit_operation_type_ == EditOperationType::TypingConsecutiveSpace)
      ? EditOperationType::TypingConsecutiveSpace
      : EditOperationType::TypingFirstSpace;
  }

  const AutoClosingPair* pair = nullptr;
  if (text.size() == 1) {
    pair = config_.auto_closing_pairs.find_by_open(text[0]);
    if (pair && !should_auto_close(text[0])) pair = nullptr;
  }

  std::vector<Selection> selections = cursors_.get_selections();
  std::string inserted = pair ? text + pair->close : text;
  CommandList commands;
  commands.reserve(selections.size());
  for (const auto& selection : selections) commands.push_back(ReplaceCommand{selection.range(), inserted});

  int back_columns = pair ? static_cast<int>(pair->close.size()) : 0;
  execute_commands(op_type, should_push_stack_element_between(prev_edit_operation_type_, op_type), commands, true, back_columns);

  if (pair) {
    std::vector<Range> closed;
    for (const auto& selection : cursors_.get_selections()) {
      Position p = selection.get_position();
      closed.push_back(Range(p, p.with_column(p.column + back_columns)));
    }
    track_auto_closed(closed);
  }
}

void EditSession::delete_left() {
  auto [push_before, commands] = DeleteOperations::delete_left(prev_edit_operation_type_, config_, model_,
                                                               cursors_.get_selections(), auto_closed_characters());
  execute_commands(EditOperationType::DeletingLeft, push_before, commands, false, 0);
}

void EditSession::delete_right() {
  auto [push_before, commands] = DeleteOperations::delete_right(prev_edit_operation_type_, config_, model_,
                                                                cursors_.get_selections());
  execute_commands(EditOperationType::DeletingRight, push_before, commands, false, 0);
}

std::string EditSession::cut() {
  EditOperationResult result = DeleteOperations::cut(config_, model_, cursors_.get_selections());
  std::string text;
  for (const auto& command : result.commands) {
    if (!command) continue;
    if (!text.empty() && text.back() != '\n') text.push_back('\n');
    text += model_.get_value_in_range(command->range);
  }
  // commands follow sorted selections, not cursors; markers alone place the carets
  execute_commands(result.type, result.should_push_stack_element_before, result.commands, false, 0);
  return text;
}

void EditSession::apply_view_states(const std::vector<SingleCursorState>& view_states) {
  std::vector<PartialCursorState> states;
  states.reserve(view_states.size());
  for (const auto& s : view_states) states.push_back(CursorState::from_view_state(s));
  CursorContext ctx = context();
  cursors_.set_states(ctx, states);
  cursors_.normalize(ctx);
  clear_auto_closed();
  prev_edit_operation_type_ = EditOperationType::Other;
}

void EditSession::move_left(bool in_selection_mode) {
  std::vector<SingleCursorState> states;
  for (const auto& c : cursors_.get_all()) states.push_back(MoveOperations::move_left(view_, c.view_state, in_selection_mode));
  apply_view_states(states);
}

void EditSession::move_right(bool in_selection_mode) {
  std::vector<SingleCursorState> states;
  for (const auto& c : cursors_.get_all()) states.push_back(MoveOperations::move_right(view_, c.view_state, in_selection_mode));
  apply_view_states(states);
}

void EditSession::move_up(bool in_selection_mode) {
  std::vector<SingleCursorState> states;
  for (const auto& c : cursors_.get_all()) {
    states.push_back(MoveOperations::move_up(config_, view_, c.view_state, in_selection_mode, 1));
  }
  apply_view_states(states);
}

void EditSession::move_down(bool in_selection_mode) {
  std::vector<SingleCursorState> states;
  for (const auto& c : cursors_.get_all()) {
    states.push_back(MoveOperations::move_down(config_, view_, c.view_state, in_selection_mode, 1));
  }
  apply_view_states(states);
}

void EditSession::move_to_line_start(bool in_selection_mode) {
  std::vector<SingleCursorState> states;
  for (const auto& c : cursors_.get_all()) states.push_back(MoveOperations::move_to_line_start(view_, c.view_state, in_selection_mode));
  apply_view_states(states);
}

void EditSession::move_to_line_end(bool in_selection_mode) {
  std::vector<SingleCursorState> states;
  for (const auto& c : cursors_.get_all()) states.push_back(MoveOperations::move_to_line_end(view_, c.view_state, in_selection_mode));
  apply_view_states(states);
}

bool EditSession::add_cursor_vertically(bool below) {
  std::vector<CursorState> all = cursors_.get_all();
  Position edge = below ? cursors_.get_bottom_most_view_position() : cursors_.get_top_most_view_position();
  if (below && edge.line >= view_.get_line_count()) return false;
  if (!below && edge.line <= 1) return false;

  size_t from = 0;
  for (size_t i = 0; i < all.size(); ++i) {
    if (all[i].view_state.position() != edge) continue;
    from = i;
    if (!below) break;
  }
  const SingleCursorState& source = all[from].view_state;
  SingleCursorState added = below ? MoveOperations::move_down(config_, view_, source, false, 1)
                                  : MoveOperations::move_up(config_, view_, source, false, 1);

  std::vector<PartialCursorState> states;
  states.reserve(all.size() + 1);
  for (const auto& c : all) states.push_back(PartialCursorState{c.model_state, c.view_state});
  states.push_back(CursorState::from_view_state(added));

  CursorContext ctx = context();
  cursors_.set_states(ctx, states);
  cursors_.normalize(ctx);
  clear_auto_closed();
  prev_edit_operation_type_ = EditOperationType::Other;
  return true;
}

bool EditSession::add_cursor_below() { return add_cursor_vertically(true); }

bool EditSession::add_cursor_above() { return add_cursor_vertically(false); }

void EditSession::kill_secondary_cursors() {
  CursorContext ctx = context();
  cursors_.kill_secondary_cursors(ctx);
  clear_auto_closed();
}

bool EditSession::fold(int first_line, int last_line) {
  if (!view_.hide_lines(first_line, last_line)) return false;

  // carets on the folded lines move to where the fold is shown
  std::vector<PartialCursorState> states;
  for (const auto& c : cursors_.get_all()) {
    const Selection& s = c.model_state.selection();
    if (view_.is_line_visible(s.get_position().line) && view_.is_line_visible(s.get_selection_start().line)) {
      states.push_back(CursorState::from_model_state(c.model_state));
    } else {
      Position v = view_.convert_model_position_to_view_position(s.get_position());
      states.push_back(CursorState::from_view_state(SingleCursorState::at(v)));
    }
  }
  CursorContext ctx = context();
  cursors_.set_states(ctx, states);
  cursors_.normalize(ctx);
  return true;
}

bool EditSession::fold_block_at_primary(std::string& msg) {
  int line = cursors_.get_primary_cursor().model_state.position().line;
  std::string head = model_.get_line_content(line);
  if (is_whitespace_only(head)) {
    msg = "nothing to fold at line " + std::to_string(line);
    return false;
  }
  int indent = config_.visible_column_from_column(model_, Position(line, first_non_whitespace_index(head) + 1));
  int last = line;
  for (int l = line + 1; l <= model_.get_line_count(); ++l) {
    std::string s = model_.get_line_content(l);
    if (is_whitespace_only(s)) continue;
    int child = config_.visible_column_from_column(model_, Position(l, first_non_whitespace_index(s) + 1));
    if (child <= indent) break;
    last = l;
  }
  if (last == line) {
    msg = "nothing to fold below line " + std::to_string(line);
    return false;
  }
  if (!fold(line + 1, last)) {
    msg = "cannot fold lines " + std::to_string(line + 1) + "-" + std::to_string(last);
    return false;
  }
  msg = "folded lines " + std::to_string(line + 1) + "-" + std::to_string(last);
  return true;
}

void EditSession::unfold_all() {
  view_.unhide_all();
  cursors_.ensure_valid_state(context());
}

bool EditSession::save(const std::filesystem::path& path, std::string& msg) const {
  return model_.write_file(path, msg);
}

void EditSession::track_auto_closed(const std::vector<Range>& ranges) {
  for (const auto& r : ranges) {
    std::optional<TrackedRangeId> id = model_.set_tracked_range(std::nullopt, r, TrackedRangeStickiness::NeverGrowsWhenTypingAtEdges);
    if (id) auto_closed_.push_back(*id);
  }
}

void EditSession::release_auto_closed(TrackedRangeId id) {
  for (size_t i = 0; i < auto_closed_.size(); ++i) {
    if (auto_closed_[i] != id) continue;
    model_.set_tracked_range(id, std::nullopt, TrackedRangeStickiness::NeverGrowsWhenTypingAtEdges);
    auto_closed_.erase(auto_closed_.begin() + static_cast<long>(i));
    return;
  }
}

/* drops auto-closed characters that were deleted or overwritten */
void EditSession::prune_auto_closed() {
  std::vector<TrackedRangeId> stale;
  for (const auto& id : auto_closed_) {
    std::optional<Range> r = model_.get_tracked_range(id);
    if (!r || r->is_empty() || !r->is_single_line()) { stale.push_back(id); continue; }
    std::string text = model_.get_value_in_range(*r);
    if (config_.auto_closing_pairs.close_by_end.count(text.back()) == 0) stale.push_back(id);
  }
  for (const auto& id : stale) release_auto_closed(id);
}

void EditSession::clear_auto_closed() {
  while (!auto_closed_.empty()) release_auto_closed(auto_closed_.back());
}

#pragma once
/*
 * EditSession
 *
 * Purpose: the edit-application layer of one open document. Owns the text
 * model, its folding view, the cursor configuration and the cursors, and
 * turns gestures (type, delete, cut, move, fold) into command batches.
 * Flow per edit: compute commands -> apply batch -> read markers ->
 * set_selections -> normalize.
 * Note: the cursor context is rebuilt for every call and never stored.
 */
#include <filesystem>
#include <string>
#include <vector>
#include "cursor_collection.hpp"
#include "cursor_config.hpp"
#include "edit_operation.hpp"
#include "text_model.hpp"
#include "view_model.hpp"

class EditSession {
public:
  explicit EditSession(TextModel model, CursorConfiguration config = CursorConfiguration());
  ~EditSession();
  EditSession(const EditSession&) = delete;
  EditSession& operator=(const EditSession&) = delete;

  const TextModel& model() const { return model_; }
  const ViewModel& view_model() const { return view_; }
  const CursorConfiguration& config() const { return config_; }
  const CursorCollection& cursors() const { return cursors_; }
  EditOperationType prev_edit_operation_type() const { return prev_edit_operation_type_; }
  /* undo-grouping hint of the last edit: true when it started a new undo stop */
  bool last_edit_opened_undo_stop() const { return last_push_stack_element_before_; }
  std::vector<Selection> selections() const { return cursors_.get_selections(); }
  std::vector<Range> auto_closed_characters() const;

  void set_selections(const std::vector<Selection>& selections);

  void type(const std::string& text);
  void delete_left();
  void delete_right();
  /* returns the removed text, pieces joined by newlines */
  std::string cut();

  void move_left(bool in_selection_mode);
  void move_right(bool in_selection_mode);
  void move_up(bool in_selection_mode);
  void move_down(bool in_selection_mode);
  void move_to_line_start(bool in_selection_mode);
  void move_to_line_end(bool in_selection_mode);

  /* false when the outermost cursor already sits on the first/last view line */
  bool add_cursor_below();
  bool add_cursor_above();
  void kill_secondary_cursors();

  bool fold(int first_line, int last_line);
  /* folds the lines indented deeper than the primary cursor's line right below it */
  bool fold_block_at_primary(std::string& msg);
  void unfold_all();

  bool save(const std::filesystem::path& path, std::string& msg) const;

private:
  CursorContext context();
  /* place_after_text: carets land at the end of the inserted text minus back_columns */
  void execute_commands(EditOperationType type, bool push_stack_element_before, const CommandList& commands,
                        bool place_after_text, int back_columns);
  void apply_view_states(const std::vector<SingleCursorState>& view_states);
  bool add_cursor_vertically(bool below);
  bool try_overtype(const std::string& text);
  bool should_auto_close(char ch) const;
  void track_auto_closed(const std::vector<Range>& ranges);
  void release_auto_closed(TrackedRangeId id);
  void prune_auto_closed();
  void clear_auto_closed();

  TextModel model_;
  ViewModel view_;
  CursorConfiguration config_;
  CursorCollection cursors_;
  EditOperationType prev_edit_operation_type_ = EditOperationType::Other;
  bool last_push_stack_element_before_ = false;
  std::vector<TrackedRangeId> auto_closed_;
};

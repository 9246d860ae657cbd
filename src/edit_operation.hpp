#pragma once
/*
 * EditOperation
 *
 * Purpose: what cursor algorithms hand to the edit-application layer: one
 * optional replace command per cursor plus undo-grouping hints.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

enum class EditOperationType {
  Other,
  DeletingLeft,
  DeletingRight,
  TypingOther,
  TypingFirstSpace,
  TypingConsecutiveSpace
};

struct ReplaceCommand {
  Range range;
  std::string text;
};

using CommandList = std::vector<std::optional<ReplaceCommand>>;

struct EditOperationResult {
  EditOperationType type = EditOperationType::Other;
  CommandList commands;
  bool should_push_stack_element_before = false;
  bool should_push_stack_element_after = false;
};

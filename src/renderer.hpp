#pragma once
/*
 * Renderer
 *
 * Purpose: draw the visible view lines with every cursor and selection,
 * fold markers and the status line, and keep the viewport on the primary cursor.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Editor to render.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "types.hpp"
#include "view_model.hpp"

struct Viewport {
  int top_line = 1;   // first view line on screen
  int left_col = 0;   // first byte of each line on screen
};

struct RenderInfo {
  const ViewModel* view = nullptr;
  /* view space; index 0 is the primary cursor */
  std::vector<Selection> selections;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  std::string message;
};

class Renderer {
public:
  void render(ITerminal& term, const RenderInfo& info, Viewport& vp);

private:
  void render_line(ITerminal& term, const RenderInfo& info, int row, int view_line, int left_col, int cols);
};

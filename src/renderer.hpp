#pragma once
/*
 * Renderer
 *
 * Purpose: draw the visible lines with every cell padded to its elastic
 *          width, plus the status/command line; manage viewport scrolling.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; only the visible range of widths is read.
 */
#include <string>
#include <optional>
#include <filesystem>
#include <vector>
#include "text_block.hpp"
#include "types.hpp"
#include "iterminal.hpp"

struct RenderInfo {
  const TextBlock* block = nullptr;
  Cursor cur{};
  Viewport* vp = nullptr;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  Mode mode = Mode::Normal;
  std::string message;
  std::string cmdline;
  bool show_line_numbers = false;
  char delimiter = ET_DEFAULT_DELIMITER;
};

class Renderer {
public:
  void render(ITerminal& term, const RenderInfo& info);

  /* cells laid out at their tab stops; the last cell is appended as is */
  static std::string layout_line(const Cells& cells, const std::vector<int>& widths);
};

#pragma once
/*
 * Renderer
 *
 * Purpose: draw the three status columns, the log strip and the status bar.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives snapshots from App to render. Column
 *             scroll offsets live in App and are adjusted here.
 *
 * Each column re-filters the board on every draw and applies the board's
 * selection index to its own filtered view, so a column highlights a row
 * only when that index is in its bounds.
 */
#include <array>
#include <string>
#include <vector>
#include "board.hpp"
#include "log_queue.hpp"
#include "iterminal.hpp"
#include "pane_layout.hpp"

// first item drawn in a column; kept between frames
struct ColumnViewport { int top_item = 0; };

using ColumnViewports = std::array<ColumnViewport, 3>; // indexed by Status

class Renderer {
public:
  void render(ITerminal& term,
              const Board& board,
              const LogQueue& logs,
              ColumnViewports& vps,
              const std::string& message,
              const std::string& hints);

  static const char* highlight_symbol(Status s);
  static int first_visible(const std::vector<const Item*>& items, int highlighted, int height, int top_item);

private:
  void render_column(ITerminal& term, const Rect& area, Status s, const Board& board, ColumnViewport& vp);
  void render_log(ITerminal& term, const Rect& area, const LogQueue& logs);
  void render_status(ITerminal& term, const Rect& area, const Board& board,
                     const std::string& message, const std::string& hints);
};

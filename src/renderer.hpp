#pragma once
/*
 * Renderer
 *
 * Purpose: draw a published Snapshot onto an ITerminal: grids back-to-front,
 *          then the popup menu, the cursor and a status line when the
 *          connection is gone.
 * Constraint: stateless; the snapshot is read-only and not kept.
 */
#include <string>
#include "batch_controller.hpp"
#include "iterminal.hpp"

TermStyle style_for(const HighlightTable& hl, HlId id);

class Renderer {
public:
  void render(ITerminal& term, const Snapshot& snap, ConnectionState conn, const std::string& conn_msg);
private:
  void draw_grid(ITerminal& term, const UiState& st, const PlacedGrid& pg);
  void draw_popupmenu(ITerminal& term, const UiState& st);
  void draw_cursor(ITerminal& term, const UiState& st, const CursorPresentation& cur);
  void draw_status(ITerminal& term, const UiState& st, const std::string& text);
};

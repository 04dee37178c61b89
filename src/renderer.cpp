#include "renderer.hpp"
#include <algorithm>
#include <utility>

TermStyle style_for(const HighlightTable& hl, HlId id) {
  const HlAttr& a = hl.resolve(id);
  TermStyle s;
  s.fg = hl.effective_fg(a);
  s.bg = hl.effective_bg(a);
  s.bold = a.bold;
  s.italic = a.italic;
  s.underline = a.underline || a.undercurl || a.underdouble || a.underdotted || a.underdashed;
  s.strikethrough = a.strikethrough;
  return s;
}

static int utf8_width(const std::string& s) {
  int n = 0;
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80) n++;
  return n;
}

void Renderer::draw_grid(ITerminal& term, const UiState& st, const PlacedGrid& pg) {
  TermSize sz = term.getSize();
  const Grid& g = *pg.grid;
  for (int r = 0; r < g.height(); ++r) {
    int srow = pg.area.row + r;
    if (srow < 0 || srow >= sz.rows) continue;
    int c = 0;
    while (c < g.width()) {
      // right half of a wide char: the left half already covers it
      if (g.at(r, c).text.empty()) { c++; continue; }
      HlId id = g.at(r, c).hl;
      int scol = -1;
      std::string run;
      while (c < g.width() && g.at(r, c).hl == id && !g.at(r, c).text.empty()) {
        bool wide = c + 1 < g.width() && g.at(r, c + 1).text.empty();
        // clip to the screen; a wide char needs both of its columns
        int x = pg.area.col + c;
        if (x >= 0 && x + (wide ? 1 : 0) < sz.cols) {
          if (scol < 0) scol = x;
          run += g.at(r, c).text;
        }
        c++;
        if (wide) break;
      }
      if (!run.empty()) term.draw_text(srow, scol, run, style_for(st.hl, id));
    }
  }
}

void Renderer::draw_popupmenu(ITerminal& term, const UiState& st) {
  const PopupMenuState& pm = st.popupmenu;
  if (!pm.visible || pm.items.empty()) return;
  TermSize sz = term.getSize();
  auto area = st.grids.area_of(pm.grid);
  int top = (area ? area->row : 0) + pm.row + 1;
  int left = (area ? area->col : 0) + pm.col;
  int width = 0;
  for (const auto& it : pm.items) {
    int w = utf8_width(it.word) + (it.kind.empty() ? 0 : 1 + utf8_width(it.kind));
    width = std::max(width, w);
  }
  width += 2;
  int height = std::min<int>(static_cast<int>(pm.items.size()), sz.rows - top);
  // not enough room below: open above the anchor row
  if (height < static_cast<int>(pm.items.size()) && top - 1 > sz.rows - top) {
    height = std::min<int>(static_cast<int>(pm.items.size()), top - 1);
    top = top - 1 - height;
  }
  left = std::max(0, std::min(left, sz.cols - width));

  TermStyle normal = style_for(st.hl, st.hl.group("Pmenu").value_or(0));
  TermStyle selected = normal;
  if (auto id = st.hl.group("PmenuSel")) selected = style_for(st.hl, *id);
  else std::swap(selected.fg, selected.bg);

  for (int i = 0; i < height; ++i) {
    const PopupMenuItem& it = pm.items[i];
    std::string line = " " + it.word;
    if (!it.kind.empty()) line += " " + it.kind;
    line += std::string(std::max(0, width - utf8_width(line)), ' ');
    bool sel = pm.selected && *pm.selected == i;
    term.draw_text(top + i, left, line, sel ? selected : normal);
  }
}

void Renderer::draw_cursor(ITerminal& term, const UiState& st, const CursorPresentation& cur) {
  if (!cur.visible) {
    term.set_cursor_visibility(CursorVisibility::Hidden);
    return;
  }
  term.move_cursor(cur.screen_row, cur.screen_col);
  if (cur.outline || cur.shape != CursorShape::Block) {
    term.set_cursor_visibility(CursorVisibility::Normal);
    return;
  }
  // block cursor: paint the cell under it
  const Grid* g = st.grids.find(cur.pos.grid);
  std::string text = " ";
  TermStyle cell;
  if (g && cur.pos.row < g->height() && cur.pos.col < g->width()) {
    const Cell& c = g->at(cur.pos.row, cur.pos.col);
    if (!c.text.empty()) text = c.text;
    cell = style_for(st.hl, c.hl);
  }
  TermStyle s = cell;
  if (cur.attr) {
    s.fg = cur.attr->foreground.value_or(cell.bg);
    s.bg = cur.attr->background.value_or(cell.fg);
  } else {
    std::swap(s.fg, s.bg);
  }
  term.draw_text(cur.screen_row, cur.screen_col, text, s);
  term.move_cursor(cur.screen_row, cur.screen_col);
  term.set_cursor_visibility(CursorVisibility::VeryVisible);
}

void Renderer::draw_status(ITerminal& term, const UiState& st, const std::string& text) {
  TermSize sz = term.getSize();
  if (sz.rows <= 0) return;
  TermStyle s = style_for(st.hl, 0);
  std::swap(s.fg, s.bg);
  s.bold = true;
  int row = sz.rows - 1;
  term.draw_text(row, 0, text, s);
  term.clear_to_eol(row, utf8_width(text), s);
}

void Renderer::render(ITerminal& term, const Snapshot& snap, ConnectionState conn, const std::string& conn_msg) {
  const UiState& st = snap.frame->state;
  term.clear();
  for (const PlacedGrid& pg : snap.frame->visible_grids()) draw_grid(term, st, pg);
  draw_popupmenu(term, st);
  if (conn == ConnectionState::Connected) {
    draw_cursor(term, st, snap.cursor);
  } else {
    std::string what = conn == ConnectionState::Disconnected ? "disconnected" : "protocol error";
    if (!conn_msg.empty()) what += ": " + conn_msg;
    draw_status(term, st, "[" + what + "]");
    term.set_cursor_visibility(CursorVisibility::Hidden);
  }
  term.refresh();
}

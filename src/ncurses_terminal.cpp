#include "ncurses_terminal.hpp"
#include <algorithm>
#include <climits>
#include <cstdlib>

short palette_index(std::uint32_t rgb, int colors) {
  int r = (rgb >> 16) & 0xff, g = (rgb >> 8) & 0xff, b = rgb & 0xff;
  if (colors >= 256) {
    auto level = [](int v) { return v < 48 ? 0 : v < 115 ? 1 : (v - 35) / 40; };
    // grays get the 24-step ramp
    if (std::abs(r - g) < 10 && std::abs(g - b) < 10) {
      int avg = (r + g + b) / 3;
      if (avg < 8) return 16;
      if (avg > 238) return 231;
      return static_cast<short>(232 + (avg - 8) / 10);
    }
    return static_cast<short>(16 + 36 * level(r) + 6 * level(g) + level(b));
  }
  short idx = 0;
  if (r >= 128) idx |= COLOR_RED;
  if (g >= 128) idx |= COLOR_GREEN;
  if (b >= 128) idx |= COLOR_BLUE;
  return idx;
}

// init_pair takes a short
ColorPairTable::ColorPairTable(int available) : limit_(std::min(available, SHRT_MAX + 1)) {}

short ColorPairTable::lookup(short fg, short bg, bool& fresh) {
  fresh = false;
  auto key = std::make_pair(fg, bg);
  auto it = pairs_.find(key);
  if (it != pairs_.end()) return it->second;
  // out of pairs: keep the terminal defaults
  if (next_ >= limit_) return 0;
  short id = static_cast<short>(next_++);
  pairs_.emplace(key, id);
  fresh = true;
  return id;
}

CursesAttrs curses_attrs(const TermStyle& style, short pair) {
  CursesAttrs a;
  a.pair = pair;
  if (style.bold) a.attrs |= A_BOLD;
  if (style.italic) a.attrs |= A_ITALIC;
  if (style.underline) a.attrs |= A_UNDERLINE;
  return a;
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    (void)use_default_colors();
    colors_ = true;
    pairs_ = ColorPairTable(COLOR_PAIRS);
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

CursesAttrs NcursesTerminal::attrs_for(const TermStyle& style) {
  short pair = 0;
  if (colors_) {
    short fg = palette_index(style.fg, COLORS), bg = palette_index(style.bg, COLORS);
    bool fresh = false;
    pair = pairs_.lookup(fg, bg, fresh);
    if (fresh) init_pair(pair, fg, bg);
  }
  return curses_attrs(style, pair);
}

void NcursesTerminal::draw_text(int row, int col, const std::string& text, const TermStyle& style) {
  CursesAttrs a = attrs_for(style);
  attr_set(a.attrs, a.pair, nullptr);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attr_set(A_NORMAL, 0, nullptr);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_visibility(CursorVisibility v) {
  switch (v) {
    case CursorVisibility::Hidden: curs_set(0); break;
    case CursorVisibility::Normal: curs_set(1); break;
    case CursorVisibility::VeryVisible: curs_set(2); break;
  }
}

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col, const TermStyle& style) {
  CursesAttrs a = attrs_for(style);
  attr_set(a.attrs, a.pair, nullptr);
  TermSize sz = getSize();
  for (int c = col; c < sz.cols; ++c) mvaddch(row, c, ' ');
  attr_set(A_NORMAL, 0, nullptr);
}

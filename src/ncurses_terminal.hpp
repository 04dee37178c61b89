#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input mode.
 * Colors: 24-bit colors map onto the 256-color cube (or the 8 basic colors)
 *         and color pairs are allocated on first use.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include <cstdint>
#include <map>
#include <utility>
#include "iterminal.hpp"
#include <ncurses.h>

// nearest palette index for a 24-bit color on a terminal with `colors` colors
short palette_index(std::uint32_t rgb, int colors);

// fg/bg -> pair id, handed out from 1 up to the terminal's pair count
class ColorPairTable {
public:
  explicit ColorPairTable(int available = 0);
  // 0 (terminal defaults) once the pairs run out; `fresh` asks for init_pair
  short lookup(short fg, short bg, bool& fresh);
  size_t size() const { return pairs_.size(); }
private:
  std::map<std::pair<short, short>, short> pairs_;
  int limit_;
  int next_ = 1;
};

// video attributes with the pair kept apart: COLOR_PAIR() only holds 8 bits
struct CursesAttrs {
  attr_t attrs = A_NORMAL;
  short pair = 0;
};
CursesAttrs curses_attrs(const TermStyle& style, short pair);

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text, const TermStyle& style) override;
  void move_cursor(int row, int col) override;
  void set_cursor_visibility(CursorVisibility v) override;
  void refresh() override;
  void clear_to_eol(int row, int col, const TermStyle& style) override;
private:
  CursesAttrs attrs_for(const TermStyle& style);

  bool colors_ = false;
  ColorPairTable pairs_;
};

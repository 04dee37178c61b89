#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, styled draw, cursor, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <cstdint>
#include <string>

struct TermSize { int rows; int cols; };

// resolved colors (0xRRGGBB) and flags; reverse is already applied
struct TermStyle {
  std::uint32_t fg = 0xffffff;
  std::uint32_t bg = 0x000000;
  bool bold = false;
  bool italic = false;
  bool underline = false;
  bool strikethrough = false;
  bool operator==(const TermStyle&) const = default;
};

enum class CursorVisibility { Hidden, Normal, VeryVisible };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  // one column per character; callers position double-width text themselves
  virtual void draw_text(int row, int col, const std::string& text, const TermStyle& style) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void set_cursor_visibility(CursorVisibility v) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col, const TermStyle& style) = 0;
};

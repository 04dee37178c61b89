#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests; records every cell with its style
 *          plus cursor state so rendering can be asserted without a tty.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text, const TermStyle& style) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void set_cursor_visibility(CursorVisibility v) override { cursor_vis_ = v; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col, const TermStyle& style) override;

  void resize(int rows, int cols);
  const std::string& text_at(int row, int col) const { return cells_[index(row, col)].text; }
  const TermStyle& style_at(int row, int col) const { return cells_[index(row, col)].style; }
  std::string row_text(int row) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  CursorVisibility cursor_visibility() const { return cursor_vis_; }
  int refreshes() const { return refreshes_; }

private:
  struct Cell {
    std::string text = " ";
    TermStyle style;
  };
  size_t index(int row, int col) const { return static_cast<size_t>(row) * cols_ + col; }

  int rows_;
  int cols_;
  std::vector<Cell> cells_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  CursorVisibility cursor_vis_ = CursorVisibility::Normal;
  int refreshes_ = 0;
};

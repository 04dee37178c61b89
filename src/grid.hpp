#pragma once
/*
 * Grid
 *
 * Purpose: one rectangular cell buffer (text + highlight id per cell).
 * Invariant: cells change only through write_line/clear/scroll/resize and are
 *            replaced wholesale for the written column range.
 * Note: a cell with empty text is the right half of a double-width char.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

struct Cell {
  std::string text = " ";
  HlId hl = 0;
  bool operator==(const Cell&) const = default;
};

// one entry of a grid_line event; hl omitted = previous cell's id
struct GridLineCell {
  std::string text;
  std::optional<HlId> hl;
  int repeat = 1;
};

// bottom and right are exclusive
struct ScrollRegion {
  int top = 0;
  int bottom = 0;
  int left = 0;
  int right = 0;
  bool operator==(const ScrollRegion&) const = default;
};

class Grid {
public:
  Grid() = default;
  Grid(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }

  // reallocates; contents are blank afterwards
  void resize(int width, int height);
  // false (and no change) when the run does not fit the grid
  bool write_line(int row, int col_start, const std::vector<GridLineCell>& cells);
  void clear();
  // rows > 0 moves content up; revealed cells are blank
  bool scroll(const ScrollRegion& region, int rows);

  const Cell& at(int row, int col) const { return cells_[static_cast<size_t>(row) * width_ + col]; }
  std::string row_text(int row) const;
  const ScrollRegion& scroll_region() const { return region_; }

  bool operator==(const Grid&) const = default;

private:
  Cell& cell(int row, int col) { return cells_[static_cast<size_t>(row) * width_ + col]; }
  void clear_rect(int top, int bottom, int left, int right);

  int width_ = 0;
  int height_ = 0;
  std::vector<Cell> cells_;
  ScrollRegion region_;
};

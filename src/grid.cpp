#include "grid.hpp"
#include <algorithm>
#include <cstdlib>

Grid::Grid(int width, int height) { resize(width, height); }

void Grid::resize(int width, int height) {
  width_ = std::max(0, width);
  height_ = std::max(0, height);
  cells_.assign(static_cast<size_t>(width_) * height_, Cell{});
  region_ = ScrollRegion{0, height_, 0, width_};
}

bool Grid::write_line(int row, int col_start, const std::vector<GridLineCell>& cells) {
  if (row < 0 || row >= height_ || col_start < 0) return false;
  long total = 0;
  for (const auto& c : cells) total += std::max(0, c.repeat);
  if (col_start + total > width_) return false;
  int col = col_start;
  HlId hl = 0;
  for (const auto& c : cells) {
    if (c.hl) hl = *c.hl;
    for (int i = 0; i < c.repeat; ++i) {
      Cell& dst = cell(row, col++);
      dst.text = c.text;
      dst.hl = hl;
    }
  }
  return true;
}

void Grid::clear() {
  std::fill(cells_.begin(), cells_.end(), Cell{});
}

void Grid::clear_rect(int top, int bottom, int left, int right) {
  for (int r = top; r < bottom; ++r)
    for (int c = left; c < right; ++c) cell(r, c) = Cell{};
}

bool Grid::scroll(const ScrollRegion& rg, int rows) {
  if (rg.top < 0 || rg.left < 0 || rg.bottom > height_ || rg.right > width_) return false;
  if (rg.top >= rg.bottom || rg.left >= rg.right) return false;
  region_ = rg;
  if (rows == 0) return true;
  int span = rg.bottom - rg.top;
  if (std::abs(rows) >= span) {
    clear_rect(rg.top, rg.bottom, rg.left, rg.right);
    return true;
  }
  if (rows > 0) {
    for (int r = rg.top; r < rg.bottom - rows; ++r)
      for (int c = rg.left; c < rg.right; ++c) cell(r, c) = std::move(cell(r + rows, c));
    clear_rect(rg.bottom - rows, rg.bottom, rg.left, rg.right);
  } else {
    int n = -rows;
    for (int r = rg.bottom - 1; r >= rg.top + n; --r)
      for (int c = rg.left; c < rg.right; ++c) cell(r, c) = std::move(cell(r - n, c));
    clear_rect(rg.top, rg.top + n, rg.left, rg.right);
  }
  return true;
}

std::string Grid::row_text(int row) const {
  std::string out;
  if (row < 0 || row >= height_) return out;
  for (int c = 0; c < width_; ++c) out += at(row, c).text;
  return out;
}

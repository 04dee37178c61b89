#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  cells_.resize(static_cast<size_t>(rows_) * cols_);
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  cells_.assign(static_cast<size_t>(rows_) * cols_, Cell{});
}

void HeadlessTerminal::clear() {
  for (auto& c : cells_) c = Cell{};
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text, const TermStyle& style) {
  // like mvaddnstr, a start outside the screen draws nothing
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return;
  size_t i = 0;
  while (i < text.size()) {
    // one utf-8 sequence per column
    size_t len = 1;
    while (i + len < text.size() && (static_cast<unsigned char>(text[i + len]) & 0xC0) == 0x80) len++;
    if (col >= 0 && col < cols_) cells_[index(row, col)] = Cell{text.substr(i, len), style};
    col++;
    i += len;
  }
}

void HeadlessTerminal::clear_to_eol(int row, int col, const TermStyle& style) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(col, 0); c < cols_; ++c) cells_[index(row, c)] = Cell{" ", style};
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string s;
  for (int c = 0; c < cols_; ++c) s += cells_[index(row, c)].text;
  return s;
}

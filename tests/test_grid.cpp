#include "grid.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::vector<GridLineCell> cells(const std::string& s) {
  std::vector<GridLineCell> out;
  for (char c : s) out.push_back({std::string(1, c), std::nullopt, 1});
  return out;
}

static Grid filled(int w, const std::vector<std::string>& rows) {
  Grid g(w, static_cast<int>(rows.size()));
  for (int r = 0; r < static_cast<int>(rows.size()); ++r) assert(g.write_line(r, 0, cells(rows[r])));
  return g;
}

int main() {
  Grid g(5, 3);
  assert(g.width() == 5 && g.height() == 3);
  assert(g.row_text(0) == "     ");
  assert(g.at(2, 4).hl == 0);

  // repeat and highlight carry-over
  std::vector<GridLineCell> run = {{"a", 3, 1}, {"b", std::nullopt, 2}, {"c", 7, 1}};
  assert(g.write_line(1, 1, run));
  assert(g.row_text(1) == " abbc");
  assert(g.at(1, 0).hl == 0);
  assert(g.at(1, 2).hl == 3 && g.at(1, 3).hl == 3);
  assert(g.at(1, 4).hl == 7);

  // first cell without hl defaults to 0
  assert(g.write_line(0, 0, cells("xy")));
  assert(g.at(0, 0).hl == 0 && g.at(0, 1).hl == 0);

  // run past the right edge is rejected whole
  Grid before = g;
  assert(!g.write_line(0, 3, cells("xyz")));
  assert(!g.write_line(3, 0, cells("x")));
  assert(!g.write_line(-1, 0, cells("x")));
  assert(g == before);

  // double-width char: empty text marks the right half
  std::vector<GridLineCell> wide = {{"\xe6\xbc\xa2", 1, 1}, {"", std::nullopt, 1}};
  assert(g.write_line(2, 0, wide));
  assert(g.at(2, 1).text.empty());
  assert(g.at(2, 1).hl == 1);

  g.clear();
  assert(g.row_text(1) == "     ");
  assert(g.at(1, 4).hl == 0);

  // single row scroll reveals a blank row
  Grid one = filled(5, {"abcde"});
  assert(one.scroll(ScrollRegion{0, 1, 0, 5}, 1));
  assert(one.row_text(0) == "     ");
  assert(one.at(0, 4) == Cell{});

  // scroll up inside a region
  Grid s = filled(4, {"aaaa", "bbbb", "cccc", "dddd"});
  assert(s.scroll(ScrollRegion{0, 4, 0, 4}, 1));
  assert(s.row_text(0) == "bbbb");
  assert(s.row_text(2) == "dddd");
  assert(s.row_text(3) == "    ");

  // scroll down with column bounds
  Grid d = filled(4, {"aaaa", "bbbb", "cccc", "dddd"});
  assert(d.scroll(ScrollRegion{1, 4, 1, 3}, -1));
  assert(d.row_text(0) == "aaaa");
  assert(d.row_text(1) == "b  b");
  assert(d.row_text(2) == "cbbc");
  assert(d.row_text(3) == "dccd");
  assert(d.scroll_region() == (ScrollRegion{1, 4, 1, 3}));

  // out of bounds region is ignored
  Grid e = filled(4, {"aaaa", "bbbb"});
  Grid e0 = e;
  assert(!e.scroll(ScrollRegion{0, 3, 0, 4}, 1));
  assert(!e.scroll(ScrollRegion{1, 1, 0, 4}, 1));
  assert(e == e0);

  // resize reallocates blank
  s.resize(2, 6);
  assert(s.width() == 2 && s.height() == 6);
  assert(s.row_text(5) == "  ");
  assert(s.scroll_region() == (ScrollRegion{0, 6, 0, 2}));
  return 0;
}

#include "batch_controller.hpp"
#include <cassert>
#include <string>
#include <vector>

using std::chrono::milliseconds;
using TP = BatchController::TimePoint;

static TP g_now{};

static std::vector<GridLineCell> cells(const std::string& s, std::optional<HlId> hl = std::nullopt) {
  std::vector<GridLineCell> out;
  for (char c : s) {
    out.push_back({std::string(1, c), hl, 1});
    hl.reset();
  }
  return out;
}

static ModeInfo mode(const std::string& name, CursorShape shape, int on, int off, HlId attr) {
  ModeInfo m;
  m.name = name;
  m.shape = shape;
  m.cell_percentage = shape == CursorShape::Block ? 0 : 25;
  m.blinkon = on;
  m.blinkoff = off;
  m.attr_id = attr;
  return m;
}

static void test_publish_only_at_flush() {
  BatchController bc([] { return g_now; });
  assert(bc.generation() == 0);
  assert(bc.state() == BatchState::Idle);

  bc.apply(GridResizeEvent{kGlobalGrid, 5, 2});
  bc.apply(GridLineEvent{kGlobalGrid, 0, 0, cells("hello")});
  assert(bc.state() == BatchState::Accumulating);
  Snapshot s = bc.current_snapshot();
  assert(s.frame->generation == 0);
  assert(s.frame->visible_grids().empty());

  bc.apply(FlushEvent{});
  assert(bc.state() == BatchState::Idle);
  s = bc.current_snapshot();
  assert(s.frame->generation == 1);
  auto vis = s.frame->visible_grids();
  assert(vis.size() == 1);
  assert(vis[0].grid->row_text(0) == "hello");

  // a reader keeps its frame while the next batch accumulates
  bc.apply(GridLineEvent{kGlobalGrid, 0, 0, cells("HE")});
  assert(s.frame->state.grids.find(kGlobalGrid)->row_text(0) == "hello");
  bc.on_batch_end();
  assert(bc.current_snapshot().frame->state.grids.find(kGlobalGrid)->row_text(0) == "HEllo");
  assert(s.frame->state.grids.find(kGlobalGrid)->row_text(0) == "hello");

  // flush while idle is a no-op
  bc.apply(FlushEvent{});
  bc.on_batch_end();
  assert(bc.generation() == 2);
}

static void test_disconnect_discards_batch() {
  BatchController bc([] { return g_now; });
  bc.apply(GridResizeEvent{kGlobalGrid, 4, 2});
  bc.apply(GridLineEvent{kGlobalGrid, 1, 0, cells("abcd")});
  bc.apply(FlushEvent{});
  Snapshot before = bc.current_snapshot();

  bc.apply(GridResizeEvent{kGlobalGrid, 10, 10});
  bc.apply(GridLineEvent{kGlobalGrid, 0, 0, cells("zzz")});
  bc.on_disconnect("eof");
  assert(bc.connection_state() == ConnectionState::Disconnected);
  assert(bc.connection_message() == "eof");
  assert(bc.state() == BatchState::Idle);
  Snapshot after = bc.current_snapshot();
  assert(after.frame->generation == before.frame->generation);
  assert(after.frame->state == before.frame->state);

  // the discarded writes never leak into a later publish
  bc.apply(HlGroupSetEvent{"Normal", 0});
  bc.apply(FlushEvent{});
  const Grid* g = bc.current_snapshot().frame->state.grids.find(kGlobalGrid);
  assert(g->width() == 4 && g->height() == 2);
  assert(g->row_text(1) == "abcd");

  BatchController pe([] { return g_now; });
  pe.apply(GridResizeEvent{kGlobalGrid, 4, 2});
  pe.on_protocol_error("grid_line: bad cell");
  assert(pe.connection_state() == ConnectionState::ProtocolError);
  assert(pe.current_snapshot().frame->visible_grids().empty());
}

static void test_highlights() {
  BatchController bc([] { return g_now; });
  HlAttr x;
  x.foreground = 0x112233;
  x.bold = true;
  HlAttr y;
  y.background = 0x445566;

  // a cell may use an id defined later in the same batch
  bc.apply(GridResizeEvent{kGlobalGrid, 3, 1});
  bc.apply(GridLineEvent{kGlobalGrid, 0, 0, cells("abc", 5)});
  bc.apply(HlAttrDefineEvent{5, x, {}});
  bc.apply(HlAttrDefineEvent{5, x, {}});
  bc.apply(FlushEvent{});
  const UiState& st = bc.current_snapshot().frame->state;
  assert(st.hl.resolve(5) == x);
  assert(st.grids.find(kGlobalGrid)->at(0, 2).hl == 5);

  bc.apply(HlAttrDefineEvent{5, y, {HlInfoItem{"ui", "Cursor", "Cursor"}}});
  bc.apply(FlushEvent{});
  Snapshot s = bc.current_snapshot();
  assert(s.frame->state.hl.resolve(5) == y);
  assert(s.frame->state.hl.resolve(999) == s.frame->state.hl.resolve(0));
  assert(s.frame->state.hl.group("Cursor") == 5);
  // cursor color falls back to the Cursor group
  assert(s.cursor.attr && *s.cursor.attr == y);

  bc.apply(DefaultColorsSetEvent{0xeeeeee, 0x101010});
  bc.apply(FlushEvent{});
  assert(bc.current_snapshot().frame->state.hl.default_bg() == 0x101010);
}

static void test_scroll_and_unknown_grids() {
  BatchController bc([] { return g_now; });
  bc.apply(GridResizeEvent{kGlobalGrid, 5, 1});
  bc.apply(GridLineEvent{kGlobalGrid, 0, 0, cells("abcde")});
  bc.apply(GridScrollEvent{kGlobalGrid, ScrollRegion{0, 1, 0, 5}, 1});
  // references to missing grids or rows are ignored
  bc.apply(GridLineEvent{42, 0, 0, cells("x")});
  bc.apply(GridLineEvent{kGlobalGrid, 3, 0, cells("x")});
  bc.apply(GridScrollEvent{42, ScrollRegion{0, 1, 0, 1}, 1});
  bc.apply(GridClearEvent{42});
  bc.apply(GridDestroyEvent{42});
  bc.apply(WinHideEvent{42});
  bc.apply(FlushEvent{});
  const UiState& st = bc.current_snapshot().frame->state;
  assert(st.grids.size() == 1);
  const Grid* g = st.grids.find(kGlobalGrid);
  assert(g->row_text(0) == "     ");
  assert(g->at(0, 4).hl == 0);
}

static void test_oversized_resize_ignored() {
  BatchController bc([] { return g_now; });
  bc.apply(GridResizeEvent{kGlobalGrid, 3, 2});
  bc.apply(GridResizeEvent{kGlobalGrid, 2000000000, 2000000000});
  bc.apply(GridResizeEvent{kGlobalGrid, 2000000000, 0});
  bc.apply(GridResizeEvent{kGlobalGrid, -1, 4});
  bc.apply(GridResizeEvent{7, 100000, 100000});
  bc.apply(FlushEvent{});
  const UiState& st = bc.current_snapshot().frame->state;
  assert(st.grids.size() == 1);
  assert(st.grids.find(kGlobalGrid)->width() == 3);
  assert(st.grids.find(kGlobalGrid)->height() == 2);
  assert(bc.connection_state() == ConnectionState::Connected);

  assert(valid_grid_size(80, 24));
  assert(valid_grid_size(0, 0));
  assert(valid_grid_size(2048, 2048));
  assert(!valid_grid_size(2049, 2048));
  assert(!valid_grid_size(-1, 1));
}

static void test_cursor_clamp_and_modes() {
  BatchController bc([] { return g_now; });
  g_now = TP{};
  bc.apply(GridResizeEvent{kGlobalGrid, 20, 12});
  bc.apply(GridCursorGotoEvent{kGlobalGrid, 10, 15});
  bc.apply(FlushEvent{});
  Snapshot s = bc.current_snapshot();
  assert(s.cursor.pos.row == 10);
  assert(s.cursor.visible);
  assert(s.cursor.screen_row == 10 && s.cursor.screen_col == 15);

  bc.apply(GridResizeEvent{kGlobalGrid, 8, 5});
  bc.apply(FlushEvent{});
  s = bc.current_snapshot();
  assert(s.cursor.pos.row == 4);
  assert(s.cursor.pos.col == 7);
  assert(s.frame->state.cursor.row == 4);

  // cursor on a window grid is reported in screen coordinates
  bc.apply(GridResizeEvent{2, 6, 3});
  bc.apply(WinPosEvent{2, 1, 2, 6, 3});
  bc.apply(GridCursorGotoEvent{2, 1, 1});
  bc.apply(FlushEvent{});
  s = bc.current_snapshot();
  assert(s.cursor.pos.grid == 2);
  assert(s.cursor.screen_row == 2 && s.cursor.screen_col == 3);

  // mode styles and blinking
  HlAttr cur;
  cur.background = 0x00ff00;
  bc.apply(HlAttrDefineEvent{9, cur, {}});
  bc.apply(ModeInfoSetEvent{true, {mode("normal", CursorShape::Block, 0, 0, 0),
                                   mode("insert", CursorShape::Vertical, 500, 500, 9)}});
  bc.apply(ModeChangeEvent{"insert", 1});
  bc.apply(FlushEvent{});
  s = bc.current_snapshot();
  assert(s.cursor.shape == CursorShape::Vertical);
  assert(s.cursor.cell_percentage == 25);
  assert(s.cursor.attr && s.cursor.attr->background == 0x00ff00);
  assert(bc.cursor_phase() == CursorPhase::BlinkVisible);
  assert(bc.tick(g_now + milliseconds(500)));
  assert(!bc.current_snapshot().cursor.visible);
  bc.notify_typing(g_now + milliseconds(600));
  assert(bc.current_snapshot().cursor.visible);

  // unknown mode index falls back to the default style
  bc.apply(ModeChangeEvent{"bogus", 7});
  bc.apply(FlushEvent{});
  assert(bc.current_snapshot().cursor.shape == CursorShape::Block);
  assert(bc.cursor_phase() == CursorPhase::SteadyVisible);

  // busy hides, focus loss draws an outline
  bc.apply(BusyEvent{true});
  bc.apply(FlushEvent{});
  assert(!bc.current_snapshot().cursor.visible);
  bc.apply(BusyEvent{false});
  bc.apply(FlushEvent{});
  bc.set_focus(false, g_now);
  s = bc.current_snapshot();
  assert(s.cursor.visible && s.cursor.outline);
  bc.set_focus(true, g_now);
  assert(!bc.current_snapshot().cursor.outline);

  // cursor on a destroyed grid is not drawn
  bc.apply(GridDestroyEvent{2});
  bc.apply(FlushEvent{});
  assert(!bc.current_snapshot().cursor.visible);
}

static void test_popupmenu_and_misc() {
  BatchController bc([] { return g_now; });
  bc.apply(GridResizeEvent{kGlobalGrid, 20, 10});
  bc.apply(PopupMenuShowEvent{{{"foo", "f", "", ""}, {"bar", "v", "", ""}}, std::nullopt, 3, 4, kGlobalGrid});
  bc.apply(PopupMenuSelectEvent{1});
  bc.apply(MouseEnabledEvent{false});
  bc.apply(SetTitleEvent{"main.c"});
  bc.apply(OptionSetEvent{"guifont", "Mono:h11"});
  bc.apply(FlushEvent{});
  const UiState& st = bc.current_snapshot().frame->state;
  assert(st.popupmenu.visible);
  assert(st.popupmenu.items.size() == 2);
  assert(st.popupmenu.selected == 1);
  assert(st.popupmenu.row == 3 && st.popupmenu.col == 4);
  assert(!st.mouse_enabled);
  assert(st.title == "main.c");
  assert(st.options.at("guifont") == "Mono:h11");

  bc.apply(PopupMenuHideEvent{});
  bc.apply(FlushEvent{});
  assert(!bc.current_snapshot().frame->state.popupmenu.visible);

  // floats and message grids compose above the global grid
  bc.apply(GridResizeEvent{3, 4, 2});
  bc.apply(WinFloatPosEvent{3, Anchor::NW, kGlobalGrid, 2, 2, 50});
  bc.apply(GridResizeEvent{4, 20, 1});
  bc.apply(MsgSetPosEvent{4, 9, false});
  bc.apply(FlushEvent{});
  auto vis = bc.current_snapshot().frame->visible_grids();
  assert(vis.size() == 3);
  assert(vis[0].id == kGlobalGrid && vis[1].id == 3 && vis[2].id == 4);
  bc.apply(WinCloseEvent{3});
  bc.apply(FlushEvent{});
  assert(bc.current_snapshot().frame->visible_grids().size() == 2);
}

int main() {
  test_publish_only_at_flush();
  test_disconnect_discards_batch();
  test_highlights();
  test_scroll_and_unknown_grids();
  test_oversized_resize_ignored();
  test_cursor_clamp_and_modes();
  test_popupmenu_and_misc();
  return 0;
}

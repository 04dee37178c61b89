#include "batch_controller.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "config.hpp"

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

bool valid_grid_size(int width, int height) {
  if (width < 0 || height < 0) return false;
  if (width > NVGRID_MAX_GRID_CELLS || height > NVGRID_MAX_GRID_CELLS) return false;
  return static_cast<std::int64_t>(width) * height <= NVGRID_MAX_GRID_CELLS;
}

BatchController::BatchController(ClockFn clock)
    : clock_(std::move(clock)), published_(std::make_shared<const Frame>()) {}

void BatchController::apply(const Notification& n) {
  std::lock_guard<std::mutex> lk(mu_);
  apply_locked(n);
}

void BatchController::apply_locked(const Notification& n) {
  if (std::holds_alternative<FlushEvent>(n)) {
    publish_locked();
    return;
  }
  state_ = BatchState::Accumulating;
  GridRegistry& grids = working_.grids;
  std::visit(Overloaded{
      [&](const GridResizeEvent& e) {
        if (!valid_grid_size(e.width, e.height)) {
          spdlog::warn("grid_resize: grid {} bad size {}x{}", e.grid, e.width, e.height);
          return;
        }
        grids.resize(e.grid, e.width, e.height);
      },
      [&](const GridLineEvent& e) {
        if (!grids.write_line(e.grid, e.row, e.col_start, e.cells))
          spdlog::warn("grid_line: ignored for grid {} row {} col {}", e.grid, e.row, e.col_start);
      },
      [&](const GridClearEvent& e) {
        if (!grids.clear(e.grid)) spdlog::warn("grid_clear: unknown grid {}", e.grid);
      },
      [&](const GridDestroyEvent& e) {
        if (!grids.destroy(e.grid)) spdlog::warn("grid_destroy: unknown grid {}", e.grid);
      },
      [&](const GridCursorGotoEvent& e) {
        working_.cursor = CursorPosition{e.grid, e.row, e.col};
        cursor_moved_ = true;
      },
      [&](const GridScrollEvent& e) {
        if (!grids.scroll(e.grid, e.region, e.rows))
          spdlog::warn("grid_scroll: ignored for grid {} [{},{})x[{},{})", e.grid, e.region.top,
                       e.region.bottom, e.region.left, e.region.right);
      },
      [&](const HlAttrDefineEvent& e) {
        working_.hl.define(e.id, e.attr);
        for (const auto& item : e.info) {
          if (!item.hi_name.empty()) working_.hl.set_group(item.hi_name, e.id);
          if (!item.ui_name.empty()) working_.hl.set_group(item.ui_name, e.id);
        }
      },
      [&](const HlGroupSetEvent& e) { working_.hl.set_group(e.name, e.id); },
      [&](const DefaultColorsSetEvent& e) { working_.hl.set_default_colors(e.fg, e.bg); },
      [&](const ModeInfoSetEvent& e) {
        working_.modes.set_info(e.cursor_style_enabled, e.infos);
        mode_changed_ = true;
      },
      [&](const ModeChangeEvent& e) {
        if (!working_.modes.update(e.index))
          spdlog::warn("mode_change: unknown mode index {} ({})", e.index, e.name);
        else
          spdlog::debug("mode_change: {}", e.name);
        mode_changed_ = true;
      },
      [&](const WinPosEvent& e) {
        if (!grids.set_window_position(e.grid, e.row, e.col)) spdlog::warn("win_pos: unknown grid {}", e.grid);
      },
      [&](const WinFloatPosEvent& e) {
        if (!grids.set_position(e.grid, e.anchor_grid, e.anchor_row, e.anchor_col, e.z_index, e.anchor))
          spdlog::warn("win_float_pos: unknown grid {}", e.grid);
      },
      [&](const WinHideEvent& e) {
        if (!grids.hide(e.grid)) spdlog::warn("win_hide: unknown grid {}", e.grid);
      },
      [&](const WinCloseEvent& e) {
        if (!grids.hide(e.grid)) spdlog::debug("win_close: unknown grid {}", e.grid);
      },
      [&](const MsgSetPosEvent& e) {
        if (!grids.set_message_position(e.grid, e.row, NVGRID_MESSAGE_ZINDEX))
          spdlog::warn("msg_set_pos: unknown grid {}", e.grid);
      },
      [&](const BusyEvent& e) { working_.busy = e.busy; },
      [&](const MouseEnabledEvent& e) { working_.mouse_enabled = e.enabled; },
      [&](const OptionSetEvent& e) { working_.options[e.name] = e.value; },
      [&](const SetTitleEvent& e) { working_.title = e.title; },
      [&](const PopupMenuShowEvent& e) {
        PopupMenuState& pm = working_.popupmenu;
        pm.visible = true;
        pm.items = e.items;
        pm.selected = e.selected;
        pm.row = e.row;
        pm.col = e.col;
        pm.grid = e.grid;
      },
      [&](const PopupMenuSelectEvent& e) { working_.popupmenu.selected = e.selected; },
      [&](const PopupMenuHideEvent&) { working_.popupmenu = PopupMenuState{}; },
      [&](const FlushEvent&) {},
  }, n);
}

void BatchController::on_batch_end() {
  std::lock_guard<std::mutex> lk(mu_);
  publish_locked();
}

void BatchController::publish_locked() {
  if (state_ == BatchState::Idle) return;
  // clamp before publishing so a shrunken grid never leaves the cursor outside it
  if (const Grid* g = working_.grids.find(working_.cursor.grid))
    working_.cursor = clamp_to_grid(working_.cursor, g->height(), g->width());
  auto frame = std::make_shared<Frame>();
  frame->state = working_;
  frame->generation = published_->generation + 1;
  published_ = std::move(frame);

  TimePoint now = clock_();
  if (mode_changed_) cursor_.set_mode(working_.modes.current(), now);
  if (cursor_moved_ || cursor_.position() != working_.cursor) cursor_.move_to(working_.cursor, now);
  cursor_.set_busy(working_.busy, now);
  cursor_moved_ = false;
  mode_changed_ = false;
  state_ = BatchState::Idle;
  spdlog::trace("published frame {}", published_->generation);
}

void BatchController::discard_locked() {
  if (state_ == BatchState::Accumulating) spdlog::info("discarding unfinished batch");
  working_ = published_->state;
  cursor_moved_ = false;
  mode_changed_ = false;
  state_ = BatchState::Idle;
}

void BatchController::on_disconnect(const std::string& reason) {
  std::lock_guard<std::mutex> lk(mu_);
  discard_locked();
  conn_ = ConnectionState::Disconnected;
  conn_msg_ = reason;
  spdlog::error("disconnected: {}", reason);
}

void BatchController::on_protocol_error(const std::string& msg) {
  std::lock_guard<std::mutex> lk(mu_);
  discard_locked();
  conn_ = ConnectionState::ProtocolError;
  conn_msg_ = msg;
  spdlog::error("protocol error: {}", msg);
}

CursorPresentation BatchController::present_locked(const Frame& frame) const {
  CursorPresentation p;
  const UiState& st = frame.state;
  p.pos = cursor_.position();
  const ModeInfo& mode = cursor_.mode();
  p.shape = mode.shape;
  p.cell_percentage = mode.cell_percentage;
  if (mode.attr_id != 0) p.attr = st.hl.resolve(mode.attr_id);
  else if (auto id = st.hl.group("Cursor")) p.attr = st.hl.resolve(*id);
  p.outline = cursor_.phase() == CursorPhase::NoFocus;
  auto area = st.grids.area_of(p.pos.grid);
  if (!area) return p;
  p.screen_row = area->row + p.pos.row;
  p.screen_col = area->col + p.pos.col;
  p.visible = cursor_.visible();
  return p;
}

Snapshot BatchController::current_snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return Snapshot{published_, present_locked(*published_)};
}

std::uint64_t BatchController::generation() const {
  std::lock_guard<std::mutex> lk(mu_);
  return published_->generation;
}

BatchState BatchController::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

ConnectionState BatchController::connection_state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return conn_;
}

std::string BatchController::connection_message() const {
  std::lock_guard<std::mutex> lk(mu_);
  return conn_msg_;
}

bool BatchController::tick(TimePoint now) {
  std::lock_guard<std::mutex> lk(mu_);
  return cursor_.tick(now);
}

void BatchController::notify_typing(TimePoint now) {
  std::lock_guard<std::mutex> lk(mu_);
  cursor_.on_typing(now);
}

void BatchController::set_focus(bool focused, TimePoint now) {
  std::lock_guard<std::mutex> lk(mu_);
  cursor_.set_focus(focused, now);
}

void BatchController::set_blink_limit(int limit) {
  std::lock_guard<std::mutex> lk(mu_);
  cursor_.set_blink_limit(limit);
}

std::optional<BatchController::TimePoint> BatchController::next_deadline() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cursor_.next_deadline();
}

CursorPhase BatchController::cursor_phase() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cursor_.phase();
}

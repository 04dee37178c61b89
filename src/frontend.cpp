#include "frontend.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include "trace_reader.hpp"

using std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

static int ms_until(Clock::time_point t, Clock::time_point now) {
  if (t <= now) return 0;
  return static_cast<int>(std::chrono::duration_cast<milliseconds>(t - now).count()) + 1;
}

Frontend::Frontend(const FrontendOptions& opts, std::vector<std::string> trace)
    : opts_(opts), trace_(std::move(trace)), session_(sink_) {
  session_.set_mouse_option(opts_.mouse);
  session_.negotiator().set_timeout(milliseconds(opts_.resize_timeout));
  session_.controller().set_blink_limit(opts_.blink_limit);
  handle_resize();
}

void Frontend::run() {
  for (size_t i = 0; i < trace_.size(); ++i) {
    if (!replay_line(i + 1, trace_[i])) break;
    pump_input(opts_.step_delay);
  }
  BatchController& ctl = session_.controller();
  if (ctl.connection_state() == ConnectionState::Connected) {
    session_.on_disconnect(ctl.state() == BatchState::Accumulating ? "trace ended inside a batch" : "trace ended");
  }
  render(true);
  wait_for_key();
}

bool Frontend::replay_line(size_t lineno, const std::string& line) {
  size_t i = line.find_first_not_of(" \t");
  if (i == std::string::npos || line[i] == '#') return true;
  TraceEntry entry;
  std::string msg;
  if (!parse_trace_line(line, entry, msg)) {
    session_.controller().on_protocol_error("trace line " + std::to_string(lineno) + ": " + msg);
    return false;
  }
  if (!session_.handle_notification(entry.method, entry.params.get())) return false;
  render();
  return true;
}

void Frontend::pump_input(int wait_ms) {
  auto deadline = Clock::now() + milliseconds(wait_ms);
  do {
    auto now = Clock::now();
    int budget = ms_until(deadline, now);
    if (auto d = session_.controller().next_deadline()) budget = std::min(budget, ms_until(*d, now));
    if (session_.negotiator().outstanding() || session_.negotiator().pending())
      budget = std::min(budget, 50);
    if (session_.key_pending()) budget = std::min(budget, ESCDELAY);
    timeout(budget);
    int ch = getch();
    if (ch != ERR) handle_input(ch);
    else if (session_.key_pending()) session_.on_key_timeout();
    if (session_.tick(Clock::now())) dirty_ = true;
    render();
  } while (Clock::now() < deadline);
}

void Frontend::handle_input(int ch) {
  if (ch == KEY_RESIZE) { handle_resize(); return; }
  if (ch == KEY_MOUSE) { handle_mouse(); return; }
  session_.on_key(ch);
  dirty_ = true;
}

void Frontend::handle_resize() {
  TermSize sz = term_.getSize();
  int rows = opts_.rows > 0 ? opts_.rows : sz.rows;
  int cols = opts_.cols > 0 ? opts_.cols : sz.cols;
  session_.on_window_size(cols, rows);
  dirty_ = true;
}

void Frontend::handle_mouse() {
  MEVENT me; if (getmouse(&me) != OK) return;
  std::string mods;
  if (me.bstate & BUTTON_SHIFT) mods += "S-";
  if (me.bstate & BUTTON_CTRL) mods += "C-";
  if (me.bstate & BUTTON_ALT) mods += "A-";
  struct { mmask_t press; mmask_t release; const char* name; } buttons[] = {
    {BUTTON1_PRESSED, BUTTON1_RELEASED, "left"},
    {BUTTON2_PRESSED, BUTTON2_RELEASED, "middle"},
    {BUTTON3_PRESSED, BUTTON3_RELEASED, "right"},
  };
  #ifdef BUTTON4_PRESSED
  if (me.bstate & BUTTON4_PRESSED) { session_.on_mouse("wheel", "up", mods, me.y, me.x); return; }
  #endif
  #ifdef BUTTON5_PRESSED
  if (me.bstate & BUTTON5_PRESSED) { session_.on_mouse("wheel", "down", mods, me.y, me.x); return; }
  #endif
  for (const auto& b : buttons) {
    if (me.bstate & b.press) { drag_button_ = b.name; session_.on_mouse(b.name, "press", mods, me.y, me.x); return; }
    if (me.bstate & b.release) { session_.on_mouse(b.name, "release", mods, me.y, me.x); drag_button_.clear(); return; }
  }
  if ((me.bstate & REPORT_MOUSE_POSITION) && !drag_button_.empty())
    session_.on_mouse(drag_button_, "drag", mods, me.y, me.x);
}

void Frontend::render(bool force) {
  BatchController& ctl = session_.controller();
  std::uint64_t gen = ctl.generation();
  ConnectionState conn = ctl.connection_state();
  if (!force && !dirty_ && gen == drawn_generation_ && conn == drawn_conn_) return;
  renderer_.render(term_, session_.snapshot(), conn, ctl.connection_message());
  drawn_generation_ = gen;
  drawn_conn_ = conn;
  dirty_ = false;
}

void Frontend::wait_for_key() {
  timeout(-1);
  for (;;) {
    int ch = getch();
    if (ch == ERR || ch == KEY_MOUSE) continue;
    if (ch == KEY_RESIZE) { render(true); continue; }
    return;
  }
}

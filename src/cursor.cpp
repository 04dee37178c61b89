#include "cursor.hpp"
#include <algorithm>

using std::chrono::milliseconds;

void CursorStateMachine::reset(TimePoint now) {
  since_ = now;
  first_period_ = true;
  blinks_ = 0;
  if (busy_) { phase_ = CursorPhase::SteadyHidden; return; }
  if (!focused_) { phase_ = CursorPhase::NoFocus; return; }
  phase_ = mode_.blinks() ? CursorPhase::BlinkVisible : CursorPhase::SteadyVisible;
}

void CursorStateMachine::set_mode(const ModeInfo& mode, TimePoint now) {
  mode_ = mode;
  reset(now);
}

void CursorStateMachine::move_to(const CursorPosition& pos, TimePoint now) {
  pos_ = pos;
  reset(now);
}

CursorPosition clamp_to_grid(CursorPosition pos, int rows, int cols) {
  pos.row = std::clamp(pos.row, 0, std::max(0, rows - 1));
  pos.col = std::clamp(pos.col, 0, std::max(0, cols - 1));
  return pos;
}

void CursorStateMachine::on_typing(TimePoint now) {
  reset(now);
}

void CursorStateMachine::set_focus(bool focused, TimePoint now) {
  if (focused_ == focused) return;
  focused_ = focused;
  reset(now);
}

void CursorStateMachine::set_busy(bool busy, TimePoint now) {
  if (busy_ == busy) return;
  busy_ = busy;
  reset(now);
}

std::optional<CursorStateMachine::TimePoint> CursorStateMachine::next_deadline() const {
  if (phase_ == CursorPhase::BlinkVisible) {
    int on = (first_period_ && mode_.blinkwait > 0) ? mode_.blinkwait : mode_.blinkon;
    return since_ + milliseconds(on);
  }
  if (phase_ == CursorPhase::BlinkHidden) return since_ + milliseconds(mode_.blinkoff);
  return std::nullopt;
}

bool CursorStateMachine::tick(TimePoint now) {
  bool changed = false;
  for (auto deadline = next_deadline(); deadline && *deadline <= now; deadline = next_deadline()) {
    since_ = *deadline;
    first_period_ = false;
    changed = true;
    if (phase_ == CursorPhase::BlinkHidden) {
      phase_ = CursorPhase::BlinkVisible;
      continue;
    }
    if (blink_limit_ >= 0 && blinks_ >= blink_limit_) {
      phase_ = CursorPhase::SteadyVisible;
      break;
    }
    blinks_++;
    phase_ = CursorPhase::BlinkHidden;
  }
  return changed;
}

bool CursorStateMachine::visible() const {
  return phase_ != CursorPhase::SteadyHidden && phase_ != CursorPhase::BlinkHidden;
}

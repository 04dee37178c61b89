#include "cursor.hpp"
#include <cassert>

using std::chrono::milliseconds;
using TP = CursorStateMachine::TimePoint;

static ModeInfo blinking(int wait, int on, int off) {
  ModeInfo m;
  m.name = "normal";
  m.blinkwait = wait;
  m.blinkon = on;
  m.blinkoff = off;
  return m;
}

int main() {
  TP t0{};

  // steady by default
  CursorStateMachine c;
  assert(c.phase() == CursorPhase::SteadyVisible);
  assert(!c.next_deadline());
  assert(!c.tick(t0 + milliseconds(10000)));

  // blink: visible for blinkon, hidden for blinkoff
  c.set_mode(blinking(0, 400, 250), t0);
  assert(c.phase() == CursorPhase::BlinkVisible);
  assert(c.next_deadline() == t0 + milliseconds(400));
  assert(!c.tick(t0 + milliseconds(399)));
  assert(c.tick(t0 + milliseconds(400)));
  assert(c.phase() == CursorPhase::BlinkHidden);
  assert(!c.visible());
  assert(c.tick(t0 + milliseconds(650)));
  assert(c.phase() == CursorPhase::BlinkVisible);

  // typing forces visible and restarts the timer
  c.tick(t0 + milliseconds(1050));
  assert(c.phase() == CursorPhase::BlinkHidden);
  c.on_typing(t0 + milliseconds(1100));
  assert(c.phase() == CursorPhase::BlinkVisible);
  assert(c.next_deadline() == t0 + milliseconds(1500));

  // late tick catches up over several periods: 400 on + 250 off
  c.on_typing(t0);
  assert(c.tick(t0 + milliseconds(400 + 250 + 400 + 10)));
  assert(c.phase() == CursorPhase::BlinkHidden);

  // blinkwait sets the first visible period only
  c.set_mode(blinking(700, 400, 250), t0);
  assert(c.next_deadline() == t0 + milliseconds(700));
  c.tick(t0 + milliseconds(700));
  assert(c.phase() == CursorPhase::BlinkHidden);
  c.tick(t0 + milliseconds(950));
  assert(c.next_deadline() == t0 + milliseconds(1350));

  // blinkon or blinkoff of zero means no blinking
  c.set_mode(blinking(700, 400, 0), t0);
  assert(c.phase() == CursorPhase::SteadyVisible);

  // cursor move resets the phase
  c.set_mode(blinking(0, 100, 100), t0);
  c.tick(t0 + milliseconds(100));
  assert(!c.visible());
  c.move_to(CursorPosition{kGlobalGrid, 3, 4}, t0 + milliseconds(150));
  assert(c.phase() == CursorPhase::BlinkVisible);
  assert(c.position().row == 3 && c.position().col == 4);

  // focus lost: outline regardless of the timer
  c.set_focus(false, t0 + milliseconds(160));
  assert(c.phase() == CursorPhase::NoFocus);
  assert(c.visible());
  assert(!c.next_deadline());
  assert(!c.tick(t0 + milliseconds(5000)));
  c.set_focus(true, t0 + milliseconds(5000));
  assert(c.phase() == CursorPhase::BlinkVisible);

  // busy hides until busy_stop
  c.set_busy(true, t0);
  assert(c.phase() == CursorPhase::SteadyHidden);
  assert(!c.visible());
  c.on_typing(t0);
  assert(c.phase() == CursorPhase::SteadyHidden);
  c.set_busy(false, t0);
  assert(c.phase() == CursorPhase::BlinkVisible);

  // blink limit: stays visible after N cycles
  CursorStateMachine l;
  l.set_blink_limit(2);
  l.set_mode(blinking(0, 100, 100), t0);
  l.tick(t0 + milliseconds(10000));
  assert(l.phase() == CursorPhase::SteadyVisible);
  assert(!l.next_deadline());
  l.on_typing(t0 + milliseconds(10000));
  assert(l.phase() == CursorPhase::BlinkVisible);

  // clamp
  assert(clamp_to_grid(CursorPosition{kGlobalGrid, 10, 90}, 5, 80) == (CursorPosition{kGlobalGrid, 4, 79}));
  assert(clamp_to_grid(CursorPosition{2, -3, 7}, 5, 80) == (CursorPosition{2, 0, 7}));
  assert(clamp_to_grid(CursorPosition{2, 3, 3}, 0, 0) == (CursorPosition{2, 0, 0}));
  return 0;
}

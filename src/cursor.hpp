#pragma once
/*
 * CursorStateMachine
 *
 * Purpose: cursor position plus its presentation phase (steady, blinking,
 *          hidden while busy, outline when the window lost focus).
 * Design: a pure function of elapsed time; the event loop calls tick(now)
 *         and may sleep until next_deadline(). No timers live here.
 * Note: the position is a grid id + coordinates, resolved against the
 *       registry by whoever reads it.
 */
#include <chrono>
#include <optional>
#include "mode_info.hpp"
#include "types.hpp"

// keep a position inside a grid of the given size
CursorPosition clamp_to_grid(CursorPosition pos, int rows, int cols);

enum class CursorPhase { SteadyVisible, SteadyHidden, BlinkVisible, BlinkHidden, NoFocus };

class CursorStateMachine {
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  void set_mode(const ModeInfo& mode, TimePoint now);
  void move_to(const CursorPosition& pos, TimePoint now);
  void on_typing(TimePoint now);
  void set_focus(bool focused, TimePoint now);
  void set_busy(bool busy, TimePoint now);
  // number of blink cycles before staying visible; -1 = unlimited
  void set_blink_limit(int limit) { blink_limit_ = limit; }

  // advances the blink phase; true when the phase changed
  bool tick(TimePoint now);
  std::optional<TimePoint> next_deadline() const;

  CursorPhase phase() const { return phase_; }
  bool visible() const;
  bool focused() const { return focused_; }
  bool busy() const { return busy_; }
  const CursorPosition& position() const { return pos_; }
  const ModeInfo& mode() const { return mode_; }

private:
  void reset(TimePoint now);

  ModeInfo mode_;
  CursorPosition pos_;
  CursorPhase phase_ = CursorPhase::SteadyVisible;
  TimePoint since_{};
  bool first_period_ = true;
  bool focused_ = true;
  bool busy_ = false;
  int blink_limit_ = -1;
  int blinks_ = 0;
};

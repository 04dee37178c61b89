#pragma once
/*
 * ResizeNegotiator
 *
 * Purpose: turn local size changes into at most one outstanding resize
 *          request and reconcile with the size the editor actually adopts.
 * Flow: request_resize() records the latest intent; poll() hands out a
 *       request only when none is outstanding; a primary grid_resize, a
 *       `resized` notice or the timeout answers the outstanding one.
 * Note: the editor's size is ground truth; a clamped answer is not re-sent.
 */
#include <chrono>
#include <optional>
#include "types.hpp"

class ResizeNegotiator {
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit ResizeNegotiator(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000))
      : timeout_(timeout) {}

  void request_resize(int cols, int rows);
  std::optional<CellSize> poll(TimePoint now);

  // authoritative size of the primary grid
  void on_grid_resize(int cols, int rows);
  // the editor finished handling our request (VimResized)
  void on_resize_acknowledged();

  bool attached() const { return confirmed_.has_value(); }
  bool outstanding() const { return in_flight_.has_value(); }
  std::optional<CellSize> pending() const { return pending_; }
  std::optional<CellSize> confirmed() const { return confirmed_; }
  void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

private:
  std::chrono::milliseconds timeout_;
  std::optional<CellSize> pending_;
  std::optional<CellSize> in_flight_;
  std::optional<CellSize> confirmed_;
  TimePoint sent_at_{};
};

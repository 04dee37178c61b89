#include "resize_negotiator.hpp"

void ResizeNegotiator::request_resize(int cols, int rows) {
  if (cols <= 0 || rows <= 0) return;
  CellSize want{cols, rows};
  if (in_flight_ == want) { pending_.reset(); return; }
  if (!in_flight_ && confirmed_ == want) { pending_.reset(); return; }
  pending_ = want;
}

std::optional<CellSize> ResizeNegotiator::poll(TimePoint now) {
  if (in_flight_ && now - sent_at_ >= timeout_) in_flight_.reset();
  if (in_flight_ || !pending_ || !confirmed_) return std::nullopt;
  if (*pending_ == *confirmed_) { pending_.reset(); return std::nullopt; }
  in_flight_ = pending_;
  pending_.reset();
  sent_at_ = now;
  return in_flight_;
}

void ResizeNegotiator::on_grid_resize(int cols, int rows) {
  confirmed_ = CellSize{cols, rows};
  in_flight_.reset();
  if (pending_ == confirmed_) pending_.reset();
}

void ResizeNegotiator::on_resize_acknowledged() {
  in_flight_.reset();
}

#include "session.hpp"
#include <spdlog/spdlog.h>
#include "redraw_decoder.hpp"

UiSession::UiSession(IRequestSink& sink, BatchController::ClockFn clock)
    : sink_(sink), clock_(clock), controller_(clock) {}

bool UiSession::handle_notification(const std::string& method, const msgpack::object& params) {
  if (controller_.connection_state() != ConnectionState::Connected) {
    spdlog::debug("dropping {} after connection loss", method);
    return false;
  }
  if (method == "redraw") return handle_redraw(params);
  if (method == "resized") {
    resize_.on_resize_acknowledged();
    send_pending_resize(clock_());
    return true;
  }
  spdlog::debug("ignoring notification {}", method);
  return true;
}

bool UiSession::handle_redraw(const msgpack::object& params) {
  std::vector<Notification> events;
  std::string msg;
  if (!decode_redraw(params, events, msg)) {
    controller_.on_protocol_error(msg);
    return false;
  }
  for (const auto& n : events) {
    controller_.apply(n);
    if (auto* r = std::get_if<GridResizeEvent>(&n);
        r && r->grid == kGlobalGrid && valid_grid_size(r->width, r->height))
      resize_.on_grid_resize(r->width, r->height);
  }
  send_pending_resize(clock_());
  return true;
}

void UiSession::on_disconnect(const std::string& reason) {
  controller_.on_disconnect(reason);
}

void UiSession::on_key(int ch) {
  controller_.notify_typing(clock_());
  std::string keys = input_.consume(ch);
  if (!keys.empty()) sink_.send_input(keys);
}

void UiSession::on_key_timeout() {
  std::string keys = input_.flush();
  if (!keys.empty()) sink_.send_input(keys);
}

void UiSession::on_mouse(const std::string& button, const std::string& action, const std::string& modifiers,
                         int screen_row, int screen_col) {
  Snapshot snap = controller_.current_snapshot();
  if (!mouse_option_ || !snap.frame->state.mouse_enabled) return;
  auto hit = snap.frame->state.grids.grid_at(screen_row, screen_col);
  if (!hit) {
    spdlog::debug("mouse at ({}, {}) outside every grid", screen_row, screen_col);
    return;
  }
  sink_.send_mouse(MouseInput{button, action, modifiers, hit->grid, hit->row, hit->col});
}

void UiSession::on_focus(bool gained) {
  controller_.set_focus(gained, clock_());
  sink_.send_focus(gained);
}

void UiSession::on_window_size(int cols, int rows) {
  // sent from tick() so a drag collapses into one request
  resize_.request_resize(cols, rows);
}

void UiSession::send_pending_resize(TimePoint now) {
  if (controller_.connection_state() != ConnectionState::Connected) return;
  if (auto req = resize_.poll(now)) sink_.send_resize(*req);
}

bool UiSession::tick(TimePoint now) {
  send_pending_resize(now);
  return controller_.tick(now);
}

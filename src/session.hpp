#pragma once
/*
 * UiSession
 *
 * Purpose: wire one editor connection to the engine. Inbound notifications
 *          go through the decoder into the batch controller and the resize
 *          negotiator; local input goes out through an IRequestSink.
 * Failure: a malformed notification moves the connection to ProtocolError;
 *          later notifications are dropped until a new session is made.
 */
#include <string>
#include <msgpack.hpp>
#include "batch_controller.hpp"
#include "input.hpp"
#include "request_sink.hpp"
#include "resize_negotiator.hpp"

class UiSession {
public:
  using Clock = BatchController::Clock;
  using TimePoint = BatchController::TimePoint;

  explicit UiSession(IRequestSink& sink, BatchController::ClockFn clock = [] { return Clock::now(); });

  // false when the notification was malformed or the connection is down
  bool handle_notification(const std::string& method, const msgpack::object& params);
  void on_disconnect(const std::string& reason);

  void on_key(int ch);
  // the key timeout passed with an ESC held back
  void on_key_timeout();
  void on_mouse(const std::string& button, const std::string& action, const std::string& modifiers,
                int screen_row, int screen_col);
  void on_focus(bool gained);
  void on_window_size(int cols, int rows);
  // cursor blink and resize retries; true when the screen needs a redraw
  bool tick(TimePoint now);

  bool key_pending() const { return input_.pending(); }
  void set_mouse_option(bool on) { mouse_option_ = on; }
  Snapshot snapshot() const { return controller_.current_snapshot(); }
  BatchController& controller() { return controller_; }
  const ResizeNegotiator& negotiator() const { return resize_; }
  ResizeNegotiator& negotiator() { return resize_; }

private:
  bool handle_redraw(const msgpack::object& params);
  void send_pending_resize(TimePoint now);

  IRequestSink& sink_;
  BatchController::ClockFn clock_;
  BatchController controller_;
  ResizeNegotiator resize_;
  Input input_;
  bool mouse_option_ = true;
};

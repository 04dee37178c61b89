#pragma once
/*
 * Frontend
 *
 * Purpose: terminal event loop around one UiSession: replays a recorded
 *          notification trace, forwards keys/mouse/resize, ticks the cursor
 *          and redraws whenever a new frame is published.
 * Note: the Terminal RAII wrapper must outlive this object.
 */
#include <cstdint>
#include <string>
#include <vector>
#include "ncurses_terminal.hpp"
#include "options.hpp"
#include "renderer.hpp"
#include "request_sink.hpp"
#include "session.hpp"

class Frontend {
public:
  Frontend(const FrontendOptions& opts, std::vector<std::string> trace);
  void run();

private:
  // false once the connection is gone
  bool replay_line(size_t lineno, const std::string& line);
  void pump_input(int wait_ms);
  void handle_input(int ch);
  void handle_mouse();
  void handle_resize();
  void render(bool force = false);
  void wait_for_key();

  const FrontendOptions& opts_;
  std::vector<std::string> trace_;
  NcursesTerminal term_;
  Renderer renderer_;
  LoggingRequestSink sink_;
  UiSession session_;
  std::uint64_t drawn_generation_ = 0;
  ConnectionState drawn_conn_ = ConnectionState::Connected;
  bool dirty_ = true;
  std::string drag_button_;
};

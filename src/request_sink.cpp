#include "request_sink.hpp"
#include <spdlog/spdlog.h>

void LoggingRequestSink::send_input(const std::string& keys) {
  spdlog::debug("nvim_input {}", keys);
}

void LoggingRequestSink::send_mouse(const MouseInput& m) {
  spdlog::debug("nvim_input_mouse {} {} '{}' grid {} ({}, {})", m.button, m.action, m.modifiers, m.grid, m.row,
                m.col);
}

void LoggingRequestSink::send_resize(const CellSize& size) {
  spdlog::debug("nvim_ui_try_resize {}x{}", size.cols, size.rows);
}

void LoggingRequestSink::send_focus(bool gained) {
  spdlog::debug("FocusGained/FocusLost: {}", gained ? "gained" : "lost");
}

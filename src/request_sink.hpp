#pragma once
/*
 * IRequestSink
 *
 * Purpose: outbound side of the UI channel (input, mouse, resize, focus) as
 *          logical values; framing and sending belong to the transport.
 * Impls: LoggingRequestSink (trace replay) and RecordingRequestSink (tests).
 */
#include <string>
#include <vector>
#include "types.hpp"

struct MouseInput {
  std::string button;     // left, middle, right, wheel
  std::string action;     // press, release, drag, up, down
  std::string modifiers;  // e.g. "C-", "S-A-"
  GridId grid = kGlobalGrid;
  int row = 0;
  int col = 0;
  bool operator==(const MouseInput&) const = default;
};

class IRequestSink {
public:
  virtual ~IRequestSink() = default;
  virtual void send_input(const std::string& keys) = 0;
  virtual void send_mouse(const MouseInput& m) = 0;
  virtual void send_resize(const CellSize& size) = 0;
  virtual void send_focus(bool gained) = 0;
};

class LoggingRequestSink : public IRequestSink {
public:
  void send_input(const std::string& keys) override;
  void send_mouse(const MouseInput& m) override;
  void send_resize(const CellSize& size) override;
  void send_focus(bool gained) override;
};

class RecordingRequestSink : public IRequestSink {
public:
  void send_input(const std::string& keys) override { inputs.push_back(keys); }
  void send_mouse(const MouseInput& m) override { mice.push_back(m); }
  void send_resize(const CellSize& size) override { resizes.push_back(size); }
  void send_focus(bool gained) override { focus.push_back(gained); }

  std::vector<std::string> inputs;
  std::vector<MouseInput> mice;
  std::vector<CellSize> resizes;
  std::vector<bool> focus;
};

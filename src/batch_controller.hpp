#pragma once
/*
 * BatchController
 *
 * Purpose: apply decoded notifications to a working UiState and publish an
 *          immutable Frame only at flush, so readers never see half a batch.
 * States: Idle -> Accumulating on the first non-flush event -> Idle at flush.
 * Failure: disconnect or protocol error discards the open batch and restores
 *          the working state from the last published frame.
 * Locking: one mutex covers apply/publish/read and the cursor timer.
 */
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "cursor.hpp"
#include "grid_registry.hpp"
#include "highlight.hpp"
#include "mode_info.hpp"
#include "notification.hpp"
#include "types.hpp"

struct PopupMenuState {
  bool visible = false;
  std::vector<PopupMenuItem> items;
  std::optional<int> selected;
  int row = 0;
  int col = 0;
  GridId grid = kGlobalGrid;
  bool operator==(const PopupMenuState&) const = default;
};

// everything a batch may mutate
struct UiState {
  GridRegistry grids;
  HighlightTable hl;
  ModeTable modes;
  CursorPosition cursor;
  bool busy = false;
  bool mouse_enabled = true;
  PopupMenuState popupmenu;
  std::string title;
  std::map<std::string, std::string> options;
  bool operator==(const UiState&) const = default;
};

// one published, read-only picture of the screen
struct Frame {
  UiState state;
  std::uint64_t generation = 0;
  std::vector<PlacedGrid> visible_grids() const { return state.grids.visible_grids(); }
};

struct CursorPresentation {
  bool visible = false;
  bool outline = false;        // window lost focus
  CursorPosition pos;
  int screen_row = 0;
  int screen_col = 0;
  CursorShape shape = CursorShape::Block;
  int cell_percentage = 0;
  std::optional<HlAttr> attr;  // unset: renderer inverts the cell
  bool operator==(const CursorPresentation&) const = default;
};

struct Snapshot {
  std::shared_ptr<const Frame> frame;
  CursorPresentation cursor;
};

// grid_resize sizes the engine accepts; others are protocol inconsistencies
bool valid_grid_size(int width, int height);

enum class BatchState { Idle, Accumulating };
enum class ConnectionState { Connected, Disconnected, ProtocolError };

class BatchController {
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using ClockFn = std::function<TimePoint()>;

  explicit BatchController(ClockFn clock = [] { return Clock::now(); });

  void apply(const Notification& n);
  void on_batch_end();
  void on_disconnect(const std::string& reason);
  void on_protocol_error(const std::string& msg);

  Snapshot current_snapshot() const;
  std::uint64_t generation() const;
  BatchState state() const;
  ConnectionState connection_state() const;
  std::string connection_message() const;

  // cursor presentation, driven by the event loop
  bool tick(TimePoint now);
  void notify_typing(TimePoint now);
  void set_focus(bool focused, TimePoint now);
  void set_blink_limit(int limit);
  std::optional<TimePoint> next_deadline() const;
  CursorPhase cursor_phase() const;

private:
  void apply_locked(const Notification& n);
  void publish_locked();
  void discard_locked();
  CursorPresentation present_locked(const Frame& frame) const;

  mutable std::mutex mu_;
  ClockFn clock_;
  UiState working_;
  std::shared_ptr<const Frame> published_;
  CursorStateMachine cursor_;
  BatchState state_ = BatchState::Idle;
  ConnectionState conn_ = ConnectionState::Connected;
  std::string conn_msg_;
  bool cursor_moved_ = false;
  bool mode_changed_ = false;
};

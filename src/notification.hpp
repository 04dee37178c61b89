#pragma once
/*
 * Notification
 *
 * Purpose: typed redraw events as decoded from the protocol; the batch
 *          controller consumes these in arrival order.
 */
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "grid.hpp"
#include "grid_registry.hpp"
#include "highlight.hpp"
#include "mode_info.hpp"
#include "types.hpp"

struct GridResizeEvent { GridId grid = 0; int width = 0; int height = 0; };
struct GridLineEvent { GridId grid = 0; int row = 0; int col_start = 0; std::vector<GridLineCell> cells; };
struct GridClearEvent { GridId grid = 0; };
struct GridDestroyEvent { GridId grid = 0; };
struct GridCursorGotoEvent { GridId grid = 0; int row = 0; int col = 0; };
struct GridScrollEvent { GridId grid = 0; ScrollRegion region; int rows = 0; };

struct HlInfoItem {
  std::string kind;
  std::string hi_name;
  std::string ui_name;
};
struct HlAttrDefineEvent { HlId id = 0; HlAttr attr; std::vector<HlInfoItem> info; };
struct HlGroupSetEvent { std::string name; HlId id = 0; };
// rgb_sp is checked by the decoder but a terminal has no separate underline color
struct DefaultColorsSetEvent { std::optional<Rgb> fg; std::optional<Rgb> bg; };

struct ModeInfoSetEvent { bool cursor_style_enabled = true; std::vector<ModeInfo> infos; };
struct ModeChangeEvent { std::string name; int index = 0; };

struct WinPosEvent { GridId grid = 0; int row = 0; int col = 0; int width = 0; int height = 0; };
struct WinFloatPosEvent {
  GridId grid = 0;
  Anchor anchor = Anchor::NW;
  GridId anchor_grid = kGlobalGrid;
  int anchor_row = 0;
  int anchor_col = 0;
  int z_index = 0;
};
struct WinHideEvent { GridId grid = 0; };
struct WinCloseEvent { GridId grid = 0; };
struct MsgSetPosEvent { GridId grid = 0; int row = 0; bool scrolled = false; };

struct BusyEvent { bool busy = false; };
struct MouseEnabledEvent { bool enabled = false; };
struct OptionSetEvent { std::string name; std::string value; };
struct SetTitleEvent { std::string title; };

struct PopupMenuItem {
  std::string word;
  std::string kind;
  std::string menu;
  std::string info;
  bool operator==(const PopupMenuItem&) const = default;
};
struct PopupMenuShowEvent { std::vector<PopupMenuItem> items; std::optional<int> selected; int row = 0; int col = 0; GridId grid = kGlobalGrid; };
struct PopupMenuSelectEvent { std::optional<int> selected; };
struct PopupMenuHideEvent {};

struct FlushEvent {};

using Notification = std::variant<
    GridResizeEvent, GridLineEvent, GridClearEvent, GridDestroyEvent, GridCursorGotoEvent, GridScrollEvent,
    HlAttrDefineEvent, HlGroupSetEvent, DefaultColorsSetEvent,
    ModeInfoSetEvent, ModeChangeEvent,
    WinPosEvent, WinFloatPosEvent, WinHideEvent, WinCloseEvent, MsgSetPosEvent,
    BusyEvent, MouseEnabledEvent, OptionSetEvent, SetTitleEvent,
    PopupMenuShowEvent, PopupMenuSelectEvent, PopupMenuHideEvent,
    FlushEvent>;

#pragma once
/*
 * GridRegistry
 *
 * Purpose: own every Grid by id and keep placement metadata (window slot,
 *          float anchor, message row, hidden) to compose one surface.
 * Design: anchors are stored as data (grid id + offset), never pointers; an
 *         anchor that no longer resolves hides the float.
 * Edge: operations on unknown ids are no-ops returning false.
 */
#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include "grid.hpp"
#include "types.hpp"

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
  bool contains(int r, int c) const { return r >= row && r < row + height && c >= col && c < col + width; }
  bool operator==(const Rect&) const = default;
};

enum class Anchor { NW, NE, SW, SE };

struct GridPlacement {
  enum class Kind { Unplaced, Global, Window, Float, Message, Hidden };
  Kind kind = Kind::Unplaced;
  int row = 0;               // Window/Message: screen row; Float: offset from anchor
  int col = 0;
  GridId anchor_grid = kGlobalGrid;
  Anchor anchor = Anchor::NW;
  int z_index = 0;
  std::uint64_t seq = 0;
  bool operator==(const GridPlacement&) const = default;
};

struct PlacedGrid {
  GridId id = 0;
  Rect area;
  int layer = 0;
  int z_index = 0;
  const Grid* grid = nullptr;
};

struct GridHit {
  GridId grid = 0;
  int row = 0;
  int col = 0;
};

class GridRegistry {
public:
  // creates the grid when absent
  void resize(GridId id, int width, int height);
  bool write_line(GridId id, int row, int col_start, const std::vector<GridLineCell>& cells);
  bool clear(GridId id);
  bool scroll(GridId id, const ScrollRegion& region, int rows);
  bool destroy(GridId id);

  // win_pos: absolute screen slot in the window layout
  bool set_window_position(GridId id, int row, int col);
  // win_float_pos: relative to another grid, explicit z-order
  bool set_position(GridId id, GridId anchor_grid, int anchor_row, int anchor_col, int z_index,
                    Anchor anchor = Anchor::NW);
  // msg_set_pos: message area starting at a row of the global grid
  bool set_message_position(GridId id, int row, int z_index);
  bool hide(GridId id);

  const Grid* find(GridId id) const;
  const GridPlacement* placement(GridId id) const;
  bool contains(GridId id) const { return entries_.count(id) != 0; }
  size_t size() const { return entries_.size(); }

  // back-to-front; recomputed on each call
  std::vector<PlacedGrid> visible_grids() const;
  std::optional<Rect> area_of(GridId id) const;
  // topmost visible grid under a screen cell, with grid-relative coordinates
  std::optional<GridHit> grid_at(int row, int col) const;

  bool operator==(const GridRegistry&) const = default;

private:
  struct Entry {
    Grid grid;
    GridPlacement placement;
    bool operator==(const Entry&) const = default;
  };

  std::optional<Rect> resolve_area(GridId id, int depth) const;
  static int layer_of(GridPlacement::Kind kind);

  std::map<GridId, Entry> entries_;
  std::uint64_t next_seq_ = 1;
};

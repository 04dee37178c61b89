#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight ids and positions (grid, highlight, cursor).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstdint>

using GridId = std::int64_t;
using HlId = std::int64_t;

// The editor numbers its global grid 1; 0 is never allocated.
constexpr GridId kGlobalGrid = 1;

struct CursorPosition {
  GridId grid = kGlobalGrid;
  int row = 0;
  int col = 0;
  bool operator==(const CursorPosition&) const = default;
};

struct CellSize {
  int cols = 0;
  int rows = 0;
  bool operator==(const CellSize&) const = default;
};

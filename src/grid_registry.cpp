#include "grid_registry.hpp"
#include <algorithm>

void GridRegistry::resize(GridId id, int width, int height) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    Entry e;
    e.grid = Grid(width, height);
    if (id == kGlobalGrid) {
      e.placement.kind = GridPlacement::Kind::Global;
      e.placement.seq = next_seq_++;
    }
    entries_.emplace(id, std::move(e));
    return;
  }
  it->second.grid.resize(width, height);
}

bool GridRegistry::write_line(GridId id, int row, int col_start, const std::vector<GridLineCell>& cells) {
  auto it = entries_.find(id);
  if (it == entries_.end()) return false;
  return it->second.grid.write_line(row, col_start, cells);
}

bool GridRegistry::clear(GridId id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) return false;
  it->second.grid.clear();
  return true;
}

bool GridRegistry::scroll(GridId id, const ScrollRegion& region, int rows) {
  auto it = entries_.find(id);
  if (it == entries_.end()) return false;
  return it->second.grid.scroll(region, rows);
}

bool GridRegistry::destroy(GridId id) {
  return entries_.erase(id) != 0;
}

bool GridRegistry::set_window_position(GridId id, int row, int col) {
  auto it = entries_.find(id);
  if (it == entries_.end() || id == kGlobalGrid) return false;
  GridPlacement& p = it->second.placement;
  p = GridPlacement{};
  p.kind = GridPlacement::Kind::Window;
  p.row = row;
  p.col = col;
  p.seq = next_seq_++;
  return true;
}

bool GridRegistry::set_position(GridId id, GridId anchor_grid, int anchor_row, int anchor_col, int z_index,
                                Anchor anchor) {
  auto it = entries_.find(id);
  if (it == entries_.end() || id == kGlobalGrid) return false;
  GridPlacement& p = it->second.placement;
  p = GridPlacement{};
  p.kind = GridPlacement::Kind::Float;
  p.anchor_grid = anchor_grid;
  p.anchor = anchor;
  p.row = anchor_row;
  p.col = anchor_col;
  p.z_index = z_index;
  p.seq = next_seq_++;
  return true;
}

bool GridRegistry::set_message_position(GridId id, int row, int z_index) {
  auto it = entries_.find(id);
  if (it == entries_.end() || id == kGlobalGrid) return false;
  GridPlacement& p = it->second.placement;
  p = GridPlacement{};
  p.kind = GridPlacement::Kind::Message;
  p.row = row;
  p.z_index = z_index;
  p.seq = next_seq_++;
  return true;
}

bool GridRegistry::hide(GridId id) {
  auto it = entries_.find(id);
  if (it == entries_.end() || id == kGlobalGrid) return false;
  it->second.placement.kind = GridPlacement::Kind::Hidden;
  return true;
}

const Grid* GridRegistry::find(GridId id) const {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second.grid;
}

const GridPlacement* GridRegistry::placement(GridId id) const {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second.placement;
}

int GridRegistry::layer_of(GridPlacement::Kind kind) {
  switch (kind) {
    case GridPlacement::Kind::Global: return 0;
    case GridPlacement::Kind::Window: return 1;
    case GridPlacement::Kind::Float:
    case GridPlacement::Kind::Message: return 2;
    default: return -1;
  }
}

std::optional<Rect> GridRegistry::resolve_area(GridId id, int depth) const {
  // a chain longer than the registry can only be a cycle
  if (depth > static_cast<int>(entries_.size())) return std::nullopt;
  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  const Grid& g = it->second.grid;
  const GridPlacement& p = it->second.placement;
  Rect r{0, 0, g.height(), g.width()};
  switch (p.kind) {
    case GridPlacement::Kind::Global:
      return r;
    case GridPlacement::Kind::Window:
      r.row = p.row;
      r.col = p.col;
      return r;
    case GridPlacement::Kind::Message:
      r.row = p.row;
      return r;
    case GridPlacement::Kind::Float: {
      if (p.anchor_grid == id) return std::nullopt;
      auto base = resolve_area(p.anchor_grid, depth + 1);
      if (!base) return std::nullopt;
      r.row = base->row + p.row;
      r.col = base->col + p.col;
      if (p.anchor == Anchor::SW || p.anchor == Anchor::SE) r.row -= r.height;
      if (p.anchor == Anchor::NE || p.anchor == Anchor::SE) r.col -= r.width;
      return r;
    }
    default:
      return std::nullopt;
  }
}

std::optional<Rect> GridRegistry::area_of(GridId id) const {
  return resolve_area(id, 0);
}

std::vector<PlacedGrid> GridRegistry::visible_grids() const {
  std::vector<std::pair<std::uint64_t, PlacedGrid>> placed;
  for (const auto& [id, e] : entries_) {
    int layer = layer_of(e.placement.kind);
    if (layer < 0) continue;
    auto area = resolve_area(id, 0);
    if (!area || area->width <= 0 || area->height <= 0) continue;
    placed.push_back({e.placement.seq, PlacedGrid{id, *area, layer, e.placement.z_index, &e.grid}});
  }
  std::stable_sort(placed.begin(), placed.end(), [](const auto& a, const auto& b) {
    if (a.second.layer != b.second.layer) return a.second.layer < b.second.layer;
    if (a.second.z_index != b.second.z_index) return a.second.z_index < b.second.z_index;
    return a.first < b.first;
  });
  std::vector<PlacedGrid> out;
  out.reserve(placed.size());
  for (auto& p : placed) out.push_back(p.second);
  return out;
}

std::optional<GridHit> GridRegistry::grid_at(int row, int col) const {
  auto grids = visible_grids();
  for (auto it = grids.rbegin(); it != grids.rend(); ++it) {
    if (!it->area.contains(row, col)) continue;
    return GridHit{it->id, row - it->area.row, col - it->area.col};
  }
  return std::nullopt;
}

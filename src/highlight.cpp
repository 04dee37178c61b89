#include "highlight.hpp"

HighlightTable::HighlightTable() {
  attrs_.emplace(0, HlAttr{});
}

void HighlightTable::define(HlId id, const HlAttr& attr) {
  if (id < 0) return;
  attrs_[id] = attr;
}

const HlAttr& HighlightTable::resolve(HlId id) const {
  auto it = attrs_.find(id);
  if (it != attrs_.end()) return it->second;
  return attrs_.at(0);
}

std::optional<HlId> HighlightTable::group(const std::string& name) const {
  auto it = groups_.find(name);
  if (it == groups_.end()) return std::nullopt;
  return it->second;
}

void HighlightTable::set_default_colors(std::optional<Rgb> fg, std::optional<Rgb> bg) {
  fg_ = fg;
  bg_ = bg;
}

static bool swapped(const HlAttr& a) { return a.reverse || a.standout; }

Rgb HighlightTable::effective_fg(const HlAttr& a) const {
  if (!swapped(a)) return a.foreground.value_or(default_fg());
  return a.background.value_or(default_bg());
}

Rgb HighlightTable::effective_bg(const HlAttr& a) const {
  if (!swapped(a)) return a.background.value_or(default_bg());
  return a.foreground.value_or(default_fg());
}

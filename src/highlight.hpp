#pragma once
/*
 * HighlightTable
 *
 * Purpose: map small integer highlight ids to resolved visual attributes.
 * Contract: resolve() is total; unknown ids give the id 0 attributes.
 *           define() replaces an entry wholesale, never merges.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include "types.hpp"

using Rgb = std::uint32_t;

constexpr Rgb kRgbBlack = 0x000000;
constexpr Rgb kRgbWhite = 0xffffff;

struct HlAttr {
  std::optional<Rgb> foreground;
  std::optional<Rgb> background;
  std::optional<Rgb> special;
  bool bold = false;
  bool italic = false;
  bool underline = false;
  bool undercurl = false;
  bool underdouble = false;
  bool underdotted = false;
  bool underdashed = false;
  bool strikethrough = false;
  bool reverse = false;
  bool standout = false;
  int blend = 0;
  bool operator==(const HlAttr&) const = default;
};

class HighlightTable {
public:
  HighlightTable();

  void define(HlId id, const HlAttr& attr);
  const HlAttr& resolve(HlId id) const;
  bool defined(HlId id) const { return attrs_.count(id) != 0; }

  // group name aliasing (hl_group_set, hl_attr_define info)
  void set_group(const std::string& name, HlId id) { groups_[name] = id; }
  std::optional<HlId> group(const std::string& name) const;

  // default_colors_set; nullopt keeps the built-in white on black
  void set_default_colors(std::optional<Rgb> fg, std::optional<Rgb> bg);
  Rgb default_fg() const { return fg_.value_or(kRgbWhite); }
  Rgb default_bg() const { return bg_.value_or(kRgbBlack); }

  // colors after reverse/standout and default fallback
  Rgb effective_fg(const HlAttr& a) const;
  Rgb effective_bg(const HlAttr& a) const;

  bool operator==(const HighlightTable&) const = default;

private:
  std::unordered_map<HlId, HlAttr> attrs_;
  std::unordered_map<std::string, HlId> groups_;
  std::optional<Rgb> fg_;
  std::optional<Rgb> bg_;
};

#pragma once
/*
 * ModeTable
 *
 * Purpose: per-mode cursor styles from mode_info_set and the active mode
 *          selected by mode_change.
 */
#include <string>
#include <vector>
#include "types.hpp"

enum class CursorShape { Block, Horizontal, Vertical };

struct ModeInfo {
  std::string name;
  std::string short_name;
  CursorShape shape = CursorShape::Block;
  int cell_percentage = 0;
  int blinkwait = 0;
  int blinkon = 0;
  int blinkoff = 0;
  HlId attr_id = 0;
  bool blinks() const { return blinkon > 0 && blinkoff > 0; }
  bool operator==(const ModeInfo&) const = default;
};

CursorShape parse_cursor_shape(const std::string& s);

class ModeTable {
public:
  ModeTable();
  void set_info(bool cursor_style_enabled, std::vector<ModeInfo> infos);
  // false when the index does not name a known mode
  bool update(int index);
  // the fallback style when no mode is active or styling is disabled
  const ModeInfo& current() const;

  bool operator==(const ModeTable&) const = default;

private:
  bool enabled_ = true;
  std::vector<ModeInfo> infos_;
  int index_ = -1;
  ModeInfo fallback_;
};

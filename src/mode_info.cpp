#include "mode_info.hpp"
#include "config.hpp"

CursorShape parse_cursor_shape(const std::string& s) {
  if (s == "horizontal") return CursorShape::Horizontal;
  if (s == "vertical") return CursorShape::Vertical;
  return CursorShape::Block;
}

ModeTable::ModeTable() {
  fallback_.blinkwait = NVGRID_DEFAULT_BLINKWAIT;
  fallback_.blinkon = NVGRID_DEFAULT_BLINKON;
  fallback_.blinkoff = NVGRID_DEFAULT_BLINKOFF;
}

void ModeTable::set_info(bool cursor_style_enabled, std::vector<ModeInfo> infos) {
  enabled_ = cursor_style_enabled;
  infos_ = std::move(infos);
  if (index_ >= static_cast<int>(infos_.size())) index_ = -1;
}

bool ModeTable::update(int index) {
  if (index < 0 || index >= static_cast<int>(infos_.size())) {
    index_ = -1;
    return false;
  }
  index_ = index;
  return true;
}

const ModeInfo& ModeTable::current() const {
  if (!enabled_ || index_ < 0) return fallback_;
  return infos_[index_];
}

#pragma once
/*
 * FrontendOptions
 *
 * Purpose: runtime options of the front-end, loaded from the rc file.
 * Format: one command per line; `set key=value`, `set flag`, `set noflag`;
 *         '#', '"' and '//' start comments; a leading ':' is allowed.
 * Failure: bad lines are reported in messages and skipped.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "config.hpp"

struct FrontendOptions {
  std::string log_file = NVGRID_LOG_FILE;
  std::string log_level = "info";
  int step_delay = NVGRID_STEP_DELAY_MS;   // ms between replayed trace lines
  bool mouse = true;
  int resize_timeout = NVGRID_RESIZE_TIMEOUT_MS;
  int blink_limit = -1;                     // -1 = unlimited
  int rows = 0;                             // 0 = terminal size
  int cols = 0;
};

class OptionLoader {
public:
  explicit OptionLoader(FrontendOptions& opts);
  bool execute_line(const std::string& line, std::string& msg);
  // false only when the file exists but can not be read
  bool load_file(const std::filesystem::path& path, std::vector<std::string>& messages, std::string& msg);
private:
  void register_commands();
  FrontendOptions& opts_;
  CommandRegistry registry_;
};

// $NVGRID_RC, else $HOME/.nvgridrc; nullopt when neither is set
std::optional<std::filesystem::path> rc_path();

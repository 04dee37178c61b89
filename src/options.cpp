#include "options.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include "file_reader.hpp"

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && p == s.data() + s.size();
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

OptionLoader::OptionLoader(FrontendOptions& opts) : opts_(opts) {
  register_commands();
}

void OptionLoader::register_commands() {
  auto int_option = [this](const std::string& name, int FrontendOptions::*field, int min) {
    registry_.register_command("set " + name, [this, name, field, min](const std::vector<std::string>& args,
                                                                        std::string& msg) {
      int v = 0;
      if (args.empty() || !parse_int(args[0], v)) { msg = "set " + name + ": use set " + name + "=<number>"; return false; }
      if (v < min) { msg = "set " + name + ": must be >= " + std::to_string(min); return false; }
      opts_.*field = v;
      return true;
    });
  };
  int_option("step_delay", &FrontendOptions::step_delay, 0);
  int_option("resize_timeout", &FrontendOptions::resize_timeout, 1);
  int_option("blink_limit", &FrontendOptions::blink_limit, -1);
  int_option("rows", &FrontendOptions::rows, 0);
  int_option("cols", &FrontendOptions::cols, 0);

  registry_.register_command("set mouse", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty() || args[0] == "on") { opts_.mouse = true; return true; }
    if (args[0] == "off") { opts_.mouse = false; return true; }
    msg = "set mouse: use set mouse on|off";
    return false;
  });
  registry_.register_command("set log_file", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set log_file: use set log_file=<path>"; return false; }
    opts_.log_file = args[0];
    return true;
  });
  registry_.register_command("set log_level", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set log_level: use set log_level=<level>"; return false; }
    auto lvl = spdlog::level::from_str(args[0]);
    // from_str maps unknown names to off
    if (lvl == spdlog::level::off && args[0] != "off") { msg = "set log_level: unknown level " + args[0]; return false; }
    opts_.log_level = args[0];
    return true;
  });
}

bool OptionLoader::execute_line(const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  return registry_.execute_line(s, msg);
}

bool OptionLoader::load_file(const std::filesystem::path& path, std::vector<std::string>& messages,
                             std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string why;
    if (!execute_line(lines[i], why)) messages.push_back(path.string() + ":" + std::to_string(i + 1) + ": " + why);
  }
  return true;
}

std::optional<std::filesystem::path> rc_path() {
  if (const char* rc = std::getenv("NVGRID_RC"); rc && *rc) return std::filesystem::path(rc);
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / NVGRID_RC_NAME;
}

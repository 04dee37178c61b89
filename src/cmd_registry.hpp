#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc commands.
 * Design: map name → handler (args vector, message out); `set key=value`
 *         routes to the handler registered as "set key".
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  // false with msg for unknown commands or rejected arguments
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const;
  bool execute_line(const std::string& line, std::string& msg) const;
private:
  std::unordered_map<std::string, Handler> map_;
};

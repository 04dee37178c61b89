#include "cmd_registry.hpp"
#include <sstream>

bool CommandRegistry::execute(const std::string& name, const std::vector<std::string>& args,
                              std::string& msg) const {
  auto it = map_.find(name);
  if (it == map_.end()) { msg = "unknown command: " + name; return false; }
  return it->second(args, msg);
}

bool CommandRegistry::execute_line(const std::string& line, std::string& msg) const {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd.empty()) return true;
  if (cmd != "set") return execute(cmd, args, msg);
  if (args.empty()) { msg = "set: missing option"; return false; }
  std::string name = args[0];
  std::string value;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    value = name.substr(eq + 1);
    name = name.substr(0, eq);
  }
  std::vector<std::string> subargs;
  if (eq != std::string::npos) subargs.push_back(value);
  for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
  // set noflag
  if (!contains("set " + name) && name.rfind("no", 0) == 0 && subargs.empty())
    return execute("set " + name.substr(2), {"off"}, msg);
  return execute("set " + name, subargs, msg);
}

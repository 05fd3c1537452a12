#include "cmd_registry.hpp"
#include <sstream>

bool CommandRegistry::execute(const std::string& name, const std::vector<std::string>& args) const {
  auto it = map_.find(name);
  if (it == map_.end()) return false;
  it->second(args);
  return true;
}

bool CommandRegistry::execute_line(const std::string& line, std::string& message) const {
  std::string s = line;
  if (!s.empty() && s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return true;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::string composite = std::string("set ") + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!execute(composite, subargs)) { message = "unknown command: " + composite; return false; }
    return true;
  }
  if (!execute(cmd, args)) { message = "unknown command: " + cmd; return false; }
  return true;
}

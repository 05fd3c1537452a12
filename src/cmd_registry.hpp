#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register, parse and dispatch Ex commands.
 * Design: map name → handler (args vector); "set opt value" and
 *         "set opt=value" dispatch to the handler named "set opt".
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool has_command(const std::string& name) const { return map_.count(name) != 0; }
  bool execute(const std::string& name, const std::vector<std::string>& args) const;
  /* parse a command line (leading ':' optional); false + message if unknown */
  bool execute_line(const std::string& line, std::string& message) const;
private:
  std::unordered_map<std::string, Handler> map_;
};

#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <filesystem>

/* parses a non-negative decimal option value; on failure sets msg */
static bool parse_option_value(const std::vector<std::string>& args, const std::string& usage, int& out, std::string& msg) {
  if (args.empty()) { msg = usage; return false; }
  const std::string& s = args[0];
  bool ok = !s.empty() && s.size() <= 9 &&
            std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) { msg = usage; return false; }
  out = std::stoi(s);
  return true;
}

void Editor::register_commands() {
  registry.register_command("w", [this](const std::vector<std::string>& args){
    if (!args.empty()) write_to(args[0]);
    else if (file_path) write_to(*file_path);
    else message = "don't have path, use :w <path>";
  });
  registry.register_command("q", [this](const std::vector<std::string>&){ close_or_quit(false); });
  registry.register_command("q!", [this](const std::vector<std::string>&){ close_or_quit(true); });
  registry.register_command("wq", [this](const std::vector<std::string>& args){
    if (!args.empty()) { if (write_to(args[0])) close_or_quit(true); }
    else if (file_path) { if (write_to(*file_path)) close_or_quit(true); }
    else if (!modified) close_or_quit(true);
    else message = "dont have path: use :wq <path>";
  });
  registry.register_command("set margin", [this](const std::vector<std::string>& args){
    int v = 0;
    if (!parse_option_value(args, "set margin: use :set margin <n>", v, message)) return;
    const TabStops& t = block.tab_stops();
    set_tab_stops(TabStops(v, t.min_size(), t.step_size()));
  });
  registry.register_command("set minsize", [this](const std::vector<std::string>& args){
    int v = 0;
    if (!parse_option_value(args, "set minsize: use :set minsize <n>", v, message)) return;
    const TabStops& t = block.tab_stops();
    set_tab_stops(TabStops(t.margin(), v, t.step_size()));
  });
  registry.register_command("set stepsize", [this](const std::vector<std::string>& args){
    int v = 0;
    if (!parse_option_value(args, "set stepsize: use :set stepsize <n>", v, message)) return;
    const TabStops& t = block.tab_stops();
    // TabStops rejects 0; execute_command reports the ConfigurationError
    set_tab_stops(TabStops(t.margin(), t.min_size(), v));
  });
  registry.register_command("set number", [this](const std::vector<std::string>& args){
    if (args.empty()) { show_line_numbers = !show_line_numbers; }
    else if (args[0] == "on") { show_line_numbers = true; }
    else if (args[0] == "off") { show_line_numbers = false; }
    else { message = "set number: use :set number on|off"; return; }
    message = show_line_numbers ? "number on" : "number off";
  });
  registry.register_command("set delimiter", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "set delimiter: use :set delimiter tab|comma|semicolon|pipe"; return; }
    const std::string& v = args[0];
    char d;
    if (v == "tab") d = '\t';
    else if (v == "comma") d = ',';
    else if (v == "semicolon") d = ';';
    else if (v == "pipe") d = '|';
    else { message = "set delimiter: unknown delimiter"; return; }
    set_delimiter(d);
    message = std::string("delimiter=") + v;
  });
  registry.register_command("widths", [this](const std::vector<std::string>&){
    std::vector<int> w = block.line_widths(cur.row);
    std::string s = "widths:";
    for (int x : w) s += " " + std::to_string(x);
    if (w.empty()) s += " (none)";
    message = s;
  });
}

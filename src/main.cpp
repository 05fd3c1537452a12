#include "editor.hpp"
#include <cstring>
#include <exception>
#include <iostream>
#include <optional>
#include <filesystem>

static void usage(const char* prog) {
  std::cerr << "usage: " << prog << " [file]\n"
            << "  opens a tab delimited file (or a sample text) with elastic tabstops\n";
}

int main(int argc, char** argv) {
  if (argc > 2) { usage(argv[0]); return 1; }
  std::optional<std::filesystem::path> path;
  if (argc == 2) {
    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) { usage(argv[0]); return 0; }
    path = std::filesystem::path(argv[1]);
  }
  try {
    Editor ed(path);
    ed.run();
  } catch (const std::exception& e) {
    // the editor (and its ncurses session) is gone by now
    std::cerr << "etdemo: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

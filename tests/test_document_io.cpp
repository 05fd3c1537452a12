#include "document_io.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::filesystem::path temp_path(const std::string& name) {
  return std::filesystem::temp_directory_path() / (name + "." + std::to_string(::getpid()));
}

static void test_parse() {
  assert((parse_document("a\tb\r\nc") == std::vector<Cells>{{"a", "b"}, {"c"}}));
  assert((parse_document("a\n\nb\n") == std::vector<Cells>{{"a"}, {""}, {"b"}, {""}}));
  assert((parse_document("a\tb\r\n") == std::vector<Cells>{{"a", "b"}, {""}}));
  assert((parse_document("\n") == std::vector<Cells>{{""}, {""}}));
  assert((parse_document("") == std::vector<Cells>{{""}}));
  assert((parse_document("x,y\nz", ',') == std::vector<Cells>{{"x", "y"}, {"z"}}));
}

static void test_round_trip() {
  auto p = temp_path("etab_io_test");
  std::vector<Cells> lines = {{"name", "size", ""}, {"a.txt", "10"}, {""}, {"long\\tname", "2000"}};
  std::string msg;
  assert(write_document(p, lines, '\t', msg));
  assert(msg.rfind("saved file: ", 0) == 0);
  assert(!std::filesystem::exists(std::filesystem::path(p.string() + ".tmp")));

  std::ifstream in(p, std::ios::binary);
  std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(raw == "name\tsize\t\na.txt\t10\n\nlong\\tname\t2000");

  std::vector<Cells> back;
  assert(read_document(p, '\t', back, msg));
  assert(back == lines);
  assert(msg.rfind("opened file: ", 0) == 0);
  std::filesystem::remove(p);
}

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// saving what was read gives back the same bytes, trailing newlines included
static void test_trailing_newlines_survive_save() {
  auto p = temp_path("etab_io_trailing");
  for (const std::string text : {"a\tb\n", "a\tb\n\n", "a\tb", "\n"}) {
    { std::ofstream out(p, std::ios::binary); out << text; }
    std::vector<Cells> first;
    std::string msg;
    assert(read_document(p, '\t', first, msg));
    assert(write_document(p, first, '\t', msg));
    assert(slurp(p) == text);
    std::vector<Cells> second;
    assert(read_document(p, '\t', second, msg));
    assert(second == first);
  }
  std::vector<Cells> lines;
  std::string msg;
  { std::ofstream out(p, std::ios::binary); out << "a\tb\n\n"; }
  assert(read_document(p, '\t', lines, msg));
  assert((lines == std::vector<Cells>{{"a", "b"}, {""}, {""}}));
  std::filesystem::remove(p);
}

static void test_empty_and_missing() {
  auto p = temp_path("etab_io_empty");
  { std::ofstream out(p); }
  std::vector<Cells> back;
  std::string msg;
  assert(read_document(p, '\t', back, msg));
  assert((back == std::vector<Cells>{{""}}));
  std::filesystem::remove(p);

  assert(!read_document(temp_path("etab_io_missing"), '\t', back, msg));
  assert(msg.rfind("can not open file: ", 0) == 0);
  assert(back.empty());

  std::vector<Cells> lines = {{"x"}};
  assert(!write_document(std::filesystem::path("/nonexistent-dir/etab/out.tsv"), lines, '\t', msg));
  assert(msg.rfind("write file failed: ", 0) == 0);
}

void run_document_io_tests() {
  test_parse();
  test_round_trip();
  test_trailing_newlines_survive_save();
  test_empty_and_missing();
}

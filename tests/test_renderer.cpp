#include "renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>

static void test_layout_line() {
  assert(Renderer::layout_line({"a", "bb", "c"}, {4, 3}) == "a   bb c");
  assert(Renderer::layout_line({"ccc", "d"}, {4}) == "ccc d");
  assert(Renderer::layout_line({"only"}, {}) == "only");
  assert(Renderer::layout_line({}, {}) == "");
  // margin 0: a cell as wide as its column touches the next one
  assert(Renderer::layout_line({"ab", "c"}, {2}) == "abc");
}

static void test_render_block() {
  TextBlock block({{"a", "bb", "c"}, {"ccc", "d"}});
  HeadlessTerminal term(5, 40);
  Renderer r;
  Viewport vp;
  RenderInfo info;
  info.block = &block;
  info.vp = &vp;
  info.cur = {1, 4};
  r.render(term, info);
  assert(term.row_text(0) == "a   bb c");
  assert(term.row_text(1) == "ccc d");
  assert(term.row_text(2) == "~");
  assert(term.row_text(3) == "~");
  std::string status = term.row_text(4);
  assert(status.rfind("[No Name]", 0) == 0);
  assert(status.size() == 40 && status.substr(37) == "2,5");
  assert(term.cursor_row() == 1 && term.cursor_col() == 4);
  assert(term.refresh_count() == 1);

  // an edit moves the tab stop of the whole run
  block.replace_line(1, {"cccccc", "d"});
  info.cur = {1, 7};
  r.render(term, info);
  assert(term.row_text(0) == "a      bb c");
  assert(term.row_text(1) == "cccccc d");
  assert(term.cursor_col() == 7);
}

static void test_render_line_numbers_and_status() {
  TextBlock block({{"k", "v"}, {"key", "value"}});
  HeadlessTerminal term(4, 30);
  Renderer r;
  Viewport vp;
  RenderInfo info;
  info.block = &block;
  info.vp = &vp;
  info.show_line_numbers = true;
  info.file_path = std::filesystem::path("/tmp/table.tsv");
  info.modified = true;
  r.render(term, info);
  assert(term.row_text(0) == "1 k   v");
  assert(term.row_text(1) == "2 key value");
  assert(term.row_text(3).rfind("table.tsv [+]", 0) == 0);

  info.message = "saved file: x";
  r.render(term, info);
  assert(term.row_text(3).rfind("saved file: x", 0) == 0);

  info.mode = Mode::Command;
  info.cmdline = "set margin 2";
  r.render(term, info);
  assert(term.row_text(3) == ":set margin 2");
  assert(term.cursor_row() == 3 && term.cursor_col() == 13);
}

static void test_render_scrolls() {
  TextBlock block({{"0"}, {"1"}, {"2"}, {"3"}, {"4"}});
  HeadlessTerminal term(3, 10);
  Renderer r;
  Viewport vp;
  RenderInfo info;
  info.block = &block;
  info.vp = &vp;
  info.cur = {4, 0};
  r.render(term, info);
  assert(vp.top_line == 3);
  assert(term.row_text(0) == "3");
  assert(term.row_text(1) == "4");
  assert(term.cursor_row() == 1);

  info.cur = {0, 0};
  r.render(term, info);
  assert(vp.top_line == 0);
  assert(term.row_text(0) == "0");

  // horizontal: the cursor's rendered column stays on screen
  TextBlock wide(std::vector<Cells>{{"abcdefgh", "ijklmnop"}});
  Viewport wvp;
  info.block = &wide;
  info.vp = &wvp;
  info.cur = {0, 12};
  r.render(term, info);
  assert(wvp.left_col == 3);
  assert(term.row_text(0) == "defgh ijkl");
  assert(term.cursor_col() == 9);
}

void run_renderer_tests() {
  test_layout_line();
  test_render_block();
  test_render_line_numbers_and_status();
  test_render_scrolls();
}

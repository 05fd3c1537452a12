#include "editor.hpp"
#include <ncurses.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include "config.hpp"
#include "document_io.hpp"

static constexpr int ESC = 27;

static const char* kSampleText =
    "/* Hopefully this program should demonstrate how elastic tabstops work.\t*/\n"
    "/* Try inserting and deleting different parts of the text and watch as the tabstops move.\t*/\n"
    "/* Press i to insert, Tab inserts a cell delimiter, Esc then :q to quit.\t*/\n"
    "\n"
    "#include <stdio.h>\n"
    "\n"
    "struct ipc_perm\n"
    "{\n"
    "\tkey_t\tkey;\n"
    "\tushort\tuid;\t/* owner euid and egid\t*/\n"
    "\tushort\tgid;\t/* group id\t*/\n"
    "\tushort\tcuid;\t/* creator euid and egid\t*/\n"
    "\tcell-missing\t\t/* for test purposes\t*/\n"
    "\tushort\tmode;\t/* access modes\t*/\n"
    "\tushort\tseq;\t/* sequence number\t*/\n"
    "};\n"
    "\n"
    "int someDemoCode(\tint fred,\n"
    "\tint wilma)\n"
    "{\n"
    "\tx();\t/* try making\t*/\n"
    "\tprintf(\"hello!\\n\");\t/* this comment\t*/\n"
    "\tdoSomethingComplicated();\t/* a bit longer\t*/\n"
    "\tfor (i = start; i < end; ++i)\n"
    "\t{\n"
    "\t\tif (isPrime(i))\n"
    "\t\t{\n"
    "\t\t\t++numPrimes;\n"
    "\t\t}\n"
    "\t}\n"
    "\treturn numPrimes;\n"
    "}";

Editor::Editor(const std::optional<std::filesystem::path>& file) : file_path(file) {
  std::vector<Cells> lines;
  if (file) {
    if (!read_document(*file, delimiter, lines, message)) lines.clear();
  } else {
    lines = parse_document(kSampleText, delimiter);
  }
  block.assign(std::move(lines));
  ensure_not_empty();
  register_commands();
  load_rc();
}

void Editor::run() {
  while (!should_quit) {
    render();
    int ch = term.read_key();
    try {
      handle_input(ch);
    } catch (const std::exception& e) {
      message = e.what();
      mode = Mode::Normal;
    }
  }
}

void Editor::render() {
  RenderInfo info;
  info.block = &block;
  info.cur = cur;
  info.vp = &vp;
  info.file_path = file_path;
  info.modified = modified;
  info.mode = mode;
  info.message = message;
  info.cmdline = cmdline;
  info.show_line_numbers = show_line_numbers;
  info.delimiter = delimiter;
  renderer.render(term, info);
}

void Editor::handle_input(int ch) {
  if (mode == Mode::Command) { handle_command_input(ch); return; }
  if (mode == Mode::Insert) { handle_insert_input(ch); return; }
  handle_normal_input(ch);
}

void Editor::handle_normal_input(int ch) {
  if (ch != 'd' && ch != 'y' && ch != 'g') input.reset();
  if (ch != ':') message.clear();
  bool counting = (ch >= '1' && ch <= '9') || (ch == '0' && input.hasCount());
  switch (ch) {
    case '1': case '2': case '3': case '4': case '5': case '6': case '7': case '8': case '9':
      input.consumeDigit(ch); break;
    case '0':
      if (input.hasCount()) { input.consumeDigit('0'); break; }
      cur.col = 0; break;
    case 'h': case KEY_LEFT: move_left(); break;
    case 'l': case KEY_RIGHT: move_right(); break;
    case 'k': case KEY_UP: { size_t n = std::max<size_t>(1, input.takeCount()); for (size_t i = 0; i < n; ++i) move_up(); } break;
    case 'j': case KEY_DOWN: { size_t n = std::max<size_t>(1, input.takeCount()); for (size_t i = 0; i < n; ++i) move_down(); } break;
    case '$': cur.col = max_col_for_row(cur.row); break;
    case 'g':
      if (input.consumeGg(ch)) { cur.row = 0; clamp_cursor(); }
      break;
    case 'G': {
      size_t n = input.takeCount();
      cur.row = n > 0 ? static_cast<int>(n) - 1 : block.line_count() - 1;
      clamp_cursor();
    } break;
    case 'd':
      if (input.consumeDd(ch)) delete_lines(static_cast<int>(std::max<size_t>(1, input.takeCount())));
      break;
    case 'y':
      if (input.consumeYy(ch)) yank_lines(static_cast<int>(std::max<size_t>(1, input.takeCount())));
      break;
    case 'p': paste_below(); break;
    case 'P': paste_above(); break;
    case 'o': open_line_below(); mode = Mode::Insert; break;
    case 'O': open_line_above(); mode = Mode::Insert; break;
    case 'x': delete_char(); break;
    case 'i': mode = Mode::Insert; break;
    case 'I': cur.col = 0; mode = Mode::Insert; break;
    case 'a': mode = Mode::Insert; if (!raw_line(cur.row).empty()) cur.col++; clamp_cursor(); break;
    case 'A': mode = Mode::Insert; cur.col = static_cast<int>(raw_line(cur.row).size()); break;
    case ':': mode = Mode::Command; cmdline.clear(); break;
    default: break;
  }
  // a count only survives digits and pending prefixes
  if (!counting && ch != 'd' && ch != 'y' && ch != 'g') input.takeCount();
}

void Editor::handle_insert_input(int ch) {
  if (ch == ESC) {
    mode = Mode::Normal;
    clamp_cursor();
    return;
  }
  if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) { backspace(); return; }
  if (ch == '\n' || ch == KEY_ENTER || ch == '\r') { split_line_at_cursor(); return; }
  if (ch == KEY_LEFT) { move_left(); return; }
  if (ch == KEY_RIGHT) { move_right(); return; }
  if (ch == KEY_UP) { move_up(); return; }
  if (ch == KEY_DOWN) { move_down(); return; }
  if (ch == '\t' || (ch >= 32 && ch <= 126)) insert_char(static_cast<char>(ch));
}

void Editor::handle_command_input(int ch) {
  if (ch == ESC) { mode = Mode::Normal; return; }
  if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) {
    if (cmdline.empty()) { mode = Mode::Normal; return; }
    cmdline.pop_back();
    return;
  }
  if (ch == '\n' || ch == KEY_ENTER || ch == '\r') { mode = Mode::Normal; execute_command(); return; }
  if (ch >= 32 && ch <= 126) cmdline.push_back(static_cast<char>(ch));
}

void Editor::execute_command() {
  message.clear();
  try {
    registry.execute_line(cmdline, message);
  } catch (const std::exception& e) {
    message = e.what();
  }
}

void Editor::load_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  std::error_code ec;
  auto p = std::filesystem::path(home) / ET_RC_FILE_NAME;
  if (!std::filesystem::exists(p, ec)) return;
  std::vector<Cells> lines; std::string msg;
  // newline-only split: the rc file is not tab delimited
  if (!read_document(p, '\n', lines, msg)) { message = msg; return; }
  for (const auto& cells : lines) {
    std::string s = cells.empty() ? std::string() : cells[0];
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    std::string old = cmdline;
    cmdline = s;
    execute_command();
    cmdline = old;
  }
}

bool Editor::close_or_quit(bool force) {
  if (modified && !force) {
    message = "unsaved changes, use :q! to quit or :w to save";
    return false;
  }
  should_quit = true;
  return true;
}

bool Editor::write_to(const std::filesystem::path& path) {
  std::string mm;
  bool ok = write_document(path, block.lines(), delimiter, mm);
  if (ok) { modified = false; file_path = path; }
  message = mm;
  return ok;
}

std::string Editor::raw_line(int row) const { return join_cells(block.line(row), delimiter); }

void Editor::set_raw_line(int row, const std::string& s) {
  block.replace_line(row, split_cells(s, delimiter));
  modified = true;
}

int Editor::max_col_for_row(int row) const {
  int len = static_cast<int>(raw_line(row).size());
  if (mode == Mode::Insert) return len;
  return std::max(0, len - 1);
}

void Editor::clamp_cursor() {
  cur.row = std::clamp(cur.row, 0, std::max(0, block.line_count() - 1));
  cur.col = std::clamp(cur.col, 0, max_col_for_row(cur.row));
}

void Editor::ensure_not_empty() {
  if (block.empty()) block.append_line(Cells{std::string()});
}

void Editor::move_left() { if (cur.col > 0) cur.col--; }
void Editor::move_right() { if (cur.col < max_col_for_row(cur.row)) cur.col++; }
void Editor::move_up() { if (cur.row > 0) { cur.row--; clamp_cursor(); } }
void Editor::move_down() { if (cur.row + 1 < block.line_count()) { cur.row++; clamp_cursor(); } }

void Editor::delete_char() {
  std::string s = raw_line(cur.row);
  if (cur.col >= static_cast<int>(s.size())) return;
  s.erase(s.begin() + cur.col);
  set_raw_line(cur.row, s);
  clamp_cursor();
}

void Editor::yank_lines(int count) {
  int end = std::min(block.line_count(), cur.row + count);
  reg.lines.assign(block.lines().begin() + cur.row, block.lines().begin() + end);
  message = std::to_string(end - cur.row) + " line(s) yanked";
}

void Editor::delete_lines(int count) {
  int end = std::min(block.line_count(), cur.row + count);
  reg.lines.assign(block.lines().begin() + cur.row, block.lines().begin() + end);
  block.erase_lines(cur.row, end);
  ensure_not_empty();
  modified = true;
  clamp_cursor();
}

void Editor::paste_below() {
  if (reg.lines.empty()) return;
  block.insert_lines(cur.row + 1, reg.lines);
  modified = true;
  cur.row++;
  cur.col = 0;
}

void Editor::paste_above() {
  if (reg.lines.empty()) return;
  block.insert_lines(cur.row, reg.lines);
  modified = true;
  cur.col = 0;
}

void Editor::open_line_below() {
  block.insert_line(cur.row + 1, Cells{std::string()});
  modified = true;
  cur.row++;
  cur.col = 0;
}

void Editor::open_line_above() {
  block.insert_line(cur.row, Cells{std::string()});
  modified = true;
  cur.col = 0;
}

void Editor::insert_char(char ch) {
  std::string s = raw_line(cur.row);
  int col = std::clamp(cur.col, 0, static_cast<int>(s.size()));
  s.insert(s.begin() + col, ch);
  set_raw_line(cur.row, s);
  cur.col = col + 1;
}

void Editor::backspace() {
  if (cur.col > 0) {
    std::string s = raw_line(cur.row);
    int col = std::min(cur.col, static_cast<int>(s.size()));
    s.erase(s.begin() + col - 1);
    set_raw_line(cur.row, s);
    cur.col = col - 1;
    return;
  }
  if (cur.row == 0) return;
  std::string prev = raw_line(cur.row - 1);
  std::string joined = prev + raw_line(cur.row);
  // one edit: the two lines become their concatenation
  std::vector<Cells> merged;
  merged.push_back(split_cells(joined, delimiter));
  block.replace_lines(cur.row - 1, cur.row + 1, std::move(merged));
  modified = true;
  cur.row--;
  cur.col = static_cast<int>(prev.size());
}

void Editor::split_line_at_cursor() {
  std::string s = raw_line(cur.row);
  int col = std::clamp(cur.col, 0, static_cast<int>(s.size()));
  std::vector<Cells> halves;
  halves.push_back(split_cells(std::string_view(s).substr(0, static_cast<size_t>(col)), delimiter));
  halves.push_back(split_cells(std::string_view(s).substr(static_cast<size_t>(col)), delimiter));
  block.replace_lines(cur.row, cur.row + 1, std::move(halves));
  modified = true;
  cur.row++;
  cur.col = 0;
}

void Editor::set_tab_stops(const TabStops& stops) {
  block = TextBlock(block.lines(), stops, text_size);
  message = "tab stops: margin=" + std::to_string(stops.margin()) +
            " minsize=" + std::to_string(stops.min_size()) +
            " stepsize=" + std::to_string(stops.step_size());
}

void Editor::set_delimiter(char d) {
  if (d == delimiter) return;
  std::vector<Cells> lines;
  lines.reserve(block.lines().size());
  for (const auto& cells : block.lines()) lines.push_back(split_cells(join_cells(cells, delimiter), d));
  delimiter = d;
  block.assign(std::move(lines));
}

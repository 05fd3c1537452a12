#include <iostream>

void run_tab_stops_tests();
void run_column_width_multiset_tests();
void run_tab_widths_tests();
void run_text_block_tests();
void run_cells_tests();
void run_renderer_tests();
void run_document_io_tests();
void run_command_tests();

static void run(const char* name, void (*fn)()) {
  fn();
  std::cout << "[ ok ] " << name << "\n";
}

int main() {
  run("tab stops", run_tab_stops_tests);
  run("column width multiset", run_column_width_multiset_tests);
  run("tab widths", run_tab_widths_tests);
  run("text block", run_text_block_tests);
  run("cells", run_cells_tests);
  run("renderer", run_renderer_tests);
  run("document io", run_document_io_tests);
  run("commands", run_command_tests);
  return 0;
}

#pragma once
/*
 * Cells
 *
 * Purpose: split delimited text into cells and map raw offsets to columns.
 * Note: the last cell of a line never takes part in alignment.
 */
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"

using Cells = std::vector<std::string>;
using SizeFunc = std::function<int(const std::string&)>;

struct CellPos { size_t cell = 0; size_t offset = 0; };

Cells split_cells(std::string_view text, char delimiter = ET_DEFAULT_DELIMITER);
std::string join_cells(const Cells& cells, char delimiter = ET_DEFAULT_DELIMITER);

/* default size function: byte length */
int text_size(const std::string& cell);

inline size_t column_count(size_t cell_count) { return cell_count > 1 ? cell_count - 1 : 0; }

std::vector<int> tab_stop_positions(const std::vector<int>& widths);

CellPos locate_cell(std::string_view text, size_t offset, char delimiter = ET_DEFAULT_DELIMITER);
int display_column(const Cells& cells, const std::vector<int>& widths, CellPos pos);

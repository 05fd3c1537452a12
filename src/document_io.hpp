#pragma once
/*
 * Document I/O
 *
 * Purpose: read a delimited text file into lines of cells (via mmap,
 *          CRLF normalized) and write it back.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 * Usage: both return false with msg on failure; msg also reports success.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "cells.hpp"

/* split raw text into lines (\n, optional \r before it) and those into cells */
std::vector<Cells> parse_document(std::string_view text, char delimiter = ET_DEFAULT_DELIMITER);

bool read_document(const std::filesystem::path& path,
                   char delimiter,
                   std::vector<Cells>& out_lines,
                   std::string& msg);

bool write_document(const std::filesystem::path& path,
                    const std::vector<Cells>& lines,
                    char delimiter,
                    std::string& msg);

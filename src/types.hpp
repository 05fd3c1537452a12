#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums of the demo (Mode/Cursor/Viewport).
 * Note: Cursor::col is a byte offset into the raw (delimited) line text.
 */

enum class Mode { Normal, Insert, Command };

struct Cursor { int row = 0; int col = 0; };
struct Viewport { int top_line = 0; int left_col = 0; };

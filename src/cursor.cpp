#include "cursor.hpp"
#include "text_buffer.hpp"
#include <algorithm>

void Cursor::clamp_column_to_hint(const TextBuffer& buf) {
  col_ = std::min(col_hint_, buf.line_length(row_));
}

void Cursor::move_up(const TextBuffer& buf) {
  if (row_ > 0) { row_--; clamp_column_to_hint(buf); }
}

void Cursor::move_down(const TextBuffer& buf) {
  if (row_ < buf.line_count() - 1) { row_++; clamp_column_to_hint(buf); }
}

void Cursor::move_left(const TextBuffer& buf) {
  if (col_ > 0) {
    set_column(col_ - 1);
  } else if (row_ > 0) {
    // wrap to the end of the previous line
    row_--;
    set_column(buf.line_length(row_));
  }
}

void Cursor::move_right(const TextBuffer& buf) {
  if (col_ < buf.line_length(row_)) {
    set_column(col_ + 1);
  } else if (row_ < buf.line_count() - 1) {
    row_++;
    set_column(0);
  }
}

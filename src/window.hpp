#pragma once
/*
 * Window
 *
 * Purpose: maps the cursor of one TextBuffer onto a fixed-size terminal body.
 * Invariant: after every cursor_* call scroll_row <= row <= scroll_row + rows - 1.
 *            Cursor moves change the row by at most one, so scrolling is
 *            always a single-row step.
 * Design: the buffer is referenced, not owned; the cursor is owned.
 *         Horizontal scrolling is not implemented (scroll_col stays 0).
 */
#include <string>
#include "types.hpp"
#include "cursor.hpp"

class TextBuffer;

class Window {
public:
  /* title line + separator line above the text body */
  static constexpr int kHeaderHeight = 2;

  Window(TextBuffer& buf, const ViewportConfig& cfg, std::string title = std::string());

  Cursor& cursor() { return cursor_; }
  const Cursor& cursor() const { return cursor_; }
  TextBuffer& buffer() { return buf_; }
  const TextBuffer& buffer() const { return buf_; }

  int scroll_row() const { return scroll_row_; }
  int scroll_col() const { return scroll_col_; }
  int viewport_rows() const { return rows_; }
  int viewport_cols() const { return cols_; }

  void cursor_up();
  void cursor_down();
  void cursor_left();
  void cursor_right();
  /* explicit placement; clamps into the buffer and scrolls as far as needed */
  void place_cursor(int row, int col);

  ScreenPos translate() const;

  const std::string& title() const { return title_; }
  void set_title(std::string title);
  const std::string& header() const { return header_; }

private:
  void follow_cursor();
  void rebuild_header();

  TextBuffer& buf_;
  Cursor cursor_;
  int scroll_row_ = 0;
  int scroll_col_ = 0;
  int rows_;
  int cols_;
  std::string title_;
  std::string header_;
};

#pragma once
/*
 * Cursor
 *
 * Purpose: logical (row, col) inside a TextBuffer plus a sticky column hint.
 * Design: set_column() moves col and col_hint together; vertical moves only
 *         call clamp_column_to_hint(), which derives col and leaves the hint.
 * Note: knows nothing about the viewport; Window adds scroll bookkeeping.
 */

class TextBuffer;

class Cursor {
public:
  int row() const { return row_; }
  int col() const { return col_; }
  int col_hint() const { return col_hint_; }

  void set_row(int row) { row_ = row; }
  void set_column(int col) { col_ = col; col_hint_ = col; }
  void clamp_column_to_hint(const TextBuffer& buf);

  void move_up(const TextBuffer& buf);
  void move_down(const TextBuffer& buf);
  void move_left(const TextBuffer& buf);
  void move_right(const TextBuffer& buf);

private:
  int row_ = 0;
  int col_ = 0;
  int col_hint_ = 0;
};

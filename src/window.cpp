#include "window.hpp"
#include "text_buffer.hpp"
#include "config.hpp"
#include <algorithm>

Window::Window(TextBuffer& buf, const ViewportConfig& cfg, std::string title)
    : buf_(buf), rows_(std::max(1, cfg.rows)), cols_(std::max(1, cfg.cols)), title_(std::move(title)) {
  rebuild_header();
}

void Window::follow_cursor() {
  if (cursor_.row() < scroll_row_) scroll_row_--;
  else if (cursor_.row() > scroll_row_ + rows_ - 1) scroll_row_++;
}

void Window::cursor_up() { cursor_.move_up(buf_); follow_cursor(); }
void Window::cursor_down() { cursor_.move_down(buf_); follow_cursor(); }
void Window::cursor_left() { cursor_.move_left(buf_); follow_cursor(); }

void Window::cursor_right() {
  if (cursor_.col() >= cols_ - 1) return;
  cursor_.move_right(buf_);
  follow_cursor();
}

void Window::place_cursor(int row, int col) {
  row = std::clamp(row, 0, buf_.line_count() - 1);
  col = std::clamp(col, 0, buf_.line_length(row));
  cursor_.set_row(row);
  cursor_.set_column(col);
  if (row < scroll_row_) scroll_row_ = row;
  if (row >= scroll_row_ + rows_) scroll_row_ = row - rows_ + 1;
}

ScreenPos Window::translate() const {
  return {cursor_.row() - scroll_row_ + kHeaderHeight, cursor_.col() - scroll_col_};
}

void Window::set_title(std::string title) {
  title_ = std::move(title);
  rebuild_header();
}

void Window::rebuild_header() {
  const std::string help = TINYED_HELP_TEXT;
  size_t width = static_cast<size_t>(cols_);
  std::string h = title_;
  if (h.size() + help.size() <= width) {
    h.append(width - h.size() - help.size(), ' ');
    h += help;
  } else {
    // too narrow for both: the title wins
    h.resize(width, ' ');
  }
  header_ = std::move(h);
}

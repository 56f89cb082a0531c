#include "headless_terminal.hpp"
#include <algorithm>
#include <stdexcept>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
    : rows_(rows), cols_(cols),
      screen_(static_cast<size_t>(rows), std::string(static_cast<size_t>(cols), ' ')),
      highlighted_(static_cast<size_t>(rows), false) {}

void HeadlessTerminal::push_keys(std::initializer_list<int> keys) {
  keys_.insert(keys_.end(), keys.begin(), keys.end());
}

void HeadlessTerminal::push_text(const std::string& text) {
  for (unsigned char c : text) keys_.push_back(c);
}

void HeadlessTerminal::clear() {
  for (auto& r : screen_) r.assign(static_cast<size_t>(cols_), ' ');
  std::fill(highlighted_.begin(), highlighted_.end(), false);
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (!in_bounds(row) || col < 0 || col >= cols_) return;
  std::string& r = screen_[static_cast<size_t>(row)];
  size_t n = std::min(text.size(), static_cast<size_t>(cols_ - col));
  r.replace(static_cast<size_t>(col), n, text, 0, n);
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  draw_text(row, col, text);
  if (in_bounds(row) && hl_len > 0 && hl_start < static_cast<int>(text.size())) {
    highlighted_[static_cast<size_t>(row)] = true;
  }
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (!in_bounds(row) || col < 0 || col >= cols_) return;
  std::string& r = screen_[static_cast<size_t>(row)];
  r.replace(static_cast<size_t>(col), r.size() - static_cast<size_t>(col),
            static_cast<size_t>(cols_ - col), ' ');
}

int HeadlessTerminal::read_key() {
  if (keys_.empty()) throw std::runtime_error("headless terminal: key script exhausted");
  int k = keys_.front();
  keys_.pop_front();
  return k;
}

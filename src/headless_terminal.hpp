#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests of rendering and the loop.
 * Screen: one std::string per row, clipped to the width; the reverse-video
 *         span is remembered per row. Keys come from a scripted queue;
 *         read_key() throws std::runtime_error when the script runs dry.
 */
#include "iterminal.hpp"
#include "types.hpp"
#include <deque>
#include <initializer_list>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  void push_keys(std::initializer_list<int> keys);
  void push_text(const std::string& text);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void move_cursor(int row, int col) override { caret_ = {row, col}; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;
  int read_key() override;

  const std::string& row_text(int row) const { return screen_[static_cast<size_t>(row)]; }
  bool row_highlighted(int row) const { return highlighted_[static_cast<size_t>(row)]; }
  ScreenPos caret() const { return caret_; }
  int refresh_count() const { return refreshes_; }

private:
  bool in_bounds(int row) const { return row >= 0 && row < rows_; }

  int rows_;
  int cols_;
  std::vector<std::string> screen_;
  std::vector<bool> highlighted_;
  std::deque<int> keys_;
  ScreenPos caret_;
  int refreshes_ = 0;
};

#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and key input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  int read_key() override;
};

#include "ncurses_terminal.hpp"
#include <algorithm>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) init_pair(1, -1, -1);
    else init_pair(1, COLOR_WHITE, COLOR_BLACK); // fallback
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(1));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(1));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
  }
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    mvaddnstr(row, col + hl_start, text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
  }
  if (hl_end < len) {
    mvaddnstr(row, col + hl_end, text.c_str() + hl_end, len - hl_end);
  }
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key() { return getch(); }

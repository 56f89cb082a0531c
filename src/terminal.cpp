#include "terminal.hpp"
#include <locale.h>
#include <stdexcept>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (screen_ == nullptr) throw std::runtime_error("can not initialize terminal");
  set_term(screen_);
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  endwin();
  delscreen(screen_);
}

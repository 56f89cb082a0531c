#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before any drawing; destructor restores the
 *        terminal on every exit path, exceptions included.
 * Note: newterm() instead of initscr() so an unusable $TERM surfaces as
 *       std::runtime_error rather than an exit inside ncurses.
 *       Raw mode, so ^Q/^W/^D reach the editor instead of the tty driver.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
private:
  SCREEN* screen_ = nullptr;
};

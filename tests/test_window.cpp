#include "window.hpp"
#include "text_buffer.hpp"
#include <cassert>
#include <random>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

static Lines numbered_lines(int n) {
  Lines ls;
  for (int i = 0; i < n; ++i) ls.push_back("line " + std::to_string(i));
  return ls;
}

static bool scroll_contains_cursor(const Window& w) {
  int r = w.cursor().row();
  return w.scroll_row() <= r && r <= w.scroll_row() + w.viewport_rows() - 1;
}

static bool cursor_legal(const Window& w) {
  const TextBuffer& b = w.buffer();
  int r = w.cursor().row(), c = w.cursor().col();
  return r >= 0 && r < b.line_count() && c >= 0 && c <= b.line_length(r);
}

static void test_scrolls_one_row_at_a_time() {
  TextBuffer b(numbered_lines(10));
  Window w(b, {3, 40});
  w.cursor_down();
  w.cursor_down();
  assert(w.scroll_row() == 0);
  w.cursor_down();
  assert(w.cursor().row() == 3);
  assert(w.scroll_row() == 1);
  for (int i = 0; i < 20; ++i) w.cursor_down();
  assert(w.cursor().row() == 9);
  assert(w.scroll_row() == 7);
  w.cursor_up();
  w.cursor_up();
  assert(w.scroll_row() == 7);
  w.cursor_up();
  assert(w.cursor().row() == 6);
  assert(w.scroll_row() == 6);
}

static void test_wrapping_moves_scroll() {
  TextBuffer b(Lines{"ab", "cd", "ef"});
  Window w(b, {1, 40});
  w.cursor_right();
  w.cursor_right();
  w.cursor_right();
  assert(w.cursor().row() == 1 && w.cursor().col() == 0);
  assert(w.scroll_row() == 1);
  w.cursor_left();
  assert(w.cursor().row() == 0 && w.cursor().col() == 2);
  assert(w.scroll_row() == 0);
}

static void test_right_stops_before_last_column() {
  TextBuffer b(Lines{"0123456789abcdef"});
  Window w(b, {5, 6});
  for (int i = 0; i < 20; ++i) w.cursor_right();
  assert(w.cursor().col() == 5);
  assert(w.cursor().row() == 0);
}

static_assert(Window::kHeaderHeight == 2, "title line + separator line");

static void test_translate() {
  TextBuffer b(numbered_lines(10));
  Window w(b, {4, 40});
  ScreenPos p = w.translate();
  assert(p.row == Window::kHeaderHeight && p.col == 0);
  w.place_cursor(6, 3);
  assert(w.scroll_row() == 3);
  p = w.translate();
  assert(p.row == 6 - 3 + Window::kHeaderHeight);
  assert(p.col == 3);
  assert(w.scroll_col() == 0);
}

static void test_place_cursor_clamps() {
  TextBuffer b(Lines{"abc", "de"});
  Window w(b, {4, 40});
  w.place_cursor(9, 9);
  assert(w.cursor().row() == 1 && w.cursor().col() == 2);
  assert(w.cursor().col_hint() == 2);
}

static void test_header_layout() {
  TextBuffer b;
  Window w(b, {4, 40}, "notes.txt");
  const std::string& h = w.header();
  assert(h.size() == 40);
  assert(h.rfind("notes.txt", 0) == 0);
  std::string help = "^W save  ^Q quit";
  assert(h.substr(40 - help.size()) == help);
  w.set_title("*notes.txt - Unsaved changes");
  assert(w.header().size() == 40);
  assert(w.header().rfind("*notes.txt", 0) == 0);
  // title and help exactly filling the width keep both
  std::string title(40 - help.size(), 't');
  Window exact(b, {4, 40}, title);
  assert(exact.header() == title + help);
  Window narrow(b, {4, 10}, "a-very-long-title.txt");
  assert(narrow.header() == "a-very-lon");
}

static void test_random_walk_keeps_invariants() {
  TextBuffer b(Lines{"short", "", "a much longer line of text", "x", "", "tail line", "y"});
  Window w(b, {3, 20});
  std::mt19937 rng(12345);
  for (int i = 0; i < 5000; ++i) {
    switch (rng() % 4) {
      case 0: w.cursor_up(); break;
      case 1: w.cursor_down(); break;
      case 2: w.cursor_left(); break;
      default: w.cursor_right(); break;
    }
    assert(cursor_legal(w));
    assert(scroll_contains_cursor(w));
  }
}

static void test_random_edits_keep_invariants() {
  TextBuffer b(Lines{"abc", "defgh", "", "ij"});
  Window w(b, {3, 12});
  std::mt19937 rng(777);
  for (int i = 0; i < 5000; ++i) {
    switch (rng() % 7) {
      case 0: w.cursor_up(); break;
      case 1: w.cursor_down(); break;
      case 2: w.cursor_left(); break;
      case 3: w.cursor_right(); break;
      case 4: b.insert(w, std::string(1, static_cast<char>('a' + rng() % 26))); break;
      case 5: b.delete_char(w); break;
      default:
        if (b.line_count() < 40) { b.split(w); w.cursor_down(); w.cursor().set_column(0); }
        break;
    }
    assert(b.line_count() >= 1);
    assert(cursor_legal(w));
    assert(scroll_contains_cursor(w));
  }
}

int main() {
  test_scrolls_one_row_at_a_time();
  test_wrapping_moves_scroll();
  test_right_stops_before_last_column();
  test_translate();
  test_place_cursor_clamps();
  test_header_layout();
  test_random_walk_keeps_invariants();
  test_random_edits_keep_invariants();
  return 0;
}

#include "renderer.hpp"
#include "window.hpp"
#include "text_buffer.hpp"
#include <algorithm>
#include <string>

void Renderer::render(ITerminal& term, const Window& win) {
  const TextBuffer& buf = win.buffer();
  int cols = win.viewport_cols();
  term.clear();
  const std::string& header = win.header();
  term.draw_highlighted(0, 0, header, 0, static_cast<int>(header.size()));
  term.draw_text(1, 0, std::string(static_cast<size_t>(cols), '-'));
  for (int i = 0; i < win.viewport_rows(); ++i) {
    int line_idx = win.scroll_row() + i;
    int screen_row = Window::kHeaderHeight + i;
    if (line_idx >= buf.line_count()) break;
    const std::string& s = buf.line(line_idx);
    // lines loaded from disk may be wider than the screen; no wrapping
    std::string vis = s.substr(0, std::min(s.size(), static_cast<size_t>(cols)));
    term.draw_text(screen_row, 0, vis);
    if (static_cast<int>(vis.size()) < cols) term.clear_to_eol(screen_row, static_cast<int>(vis.size()));
  }
  ScreenPos p = win.translate();
  term.move_cursor(p.row, std::clamp(p.col, 0, cols - 1));
  term.refresh();
}

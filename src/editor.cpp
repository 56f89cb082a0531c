#include "editor.hpp"
#include <ncurses.h>
#include <algorithm>

static constexpr int CTRL_D = 'D'-64;
static constexpr int CTRL_Q = 'Q'-64;
static constexpr int CTRL_W = 'W'-64;
static constexpr int DEL = 127;

ViewportConfig Editor::viewport_for(const TermSize& sz) {
  return {std::max(1, sz.rows - Window::kHeaderHeight), std::max(1, sz.cols)};
}

Editor::Editor(ITerminal& term, const std::filesystem::path& file, const EditorOptions& opts)
    : term_(term),
      file_path_(file),
      opts_(opts),
      buf_(TextBuffer::from_file(file, load_status_)),
      win_(buf_, viewport_for(term.getSize()), file.string()) {}

int Editor::run() {
  while (true) {
    refresh_title();
    render();
    int ch = term_.read_key();
    if (!handle_key(ch)) return 0;
  }
}

void Editor::refresh_title() {
  std::string t = buf_.dirty() ? "*" + file_path_.string() + " - Unsaved changes" : file_path_.string();
  if (!message_.empty()) t += " | " + message_;
  win_.set_title(std::move(t));
}

void Editor::render() { renderer_.render(term_, win_); }

bool Editor::handle_key(int ch) {
  message_.clear();
  switch (ch) {
    case CTRL_Q: return false;
    case CTRL_W: save(); break;
    case '\n': case '\r': case KEY_ENTER: new_line(); break;
    case KEY_UP: win_.cursor_up(); break;
    case KEY_DOWN: win_.cursor_down(); break;
    case KEY_LEFT: win_.cursor_left(); break;
    case KEY_RIGHT: win_.cursor_right(); break;
    case KEY_DC: case CTRL_D: buf_.delete_char(win_); break;
    case KEY_BACKSPACE: case DEL: case '\b': backspace(); break;
    default: insert_key(ch); break;
  }
  return true;
}

void Editor::save() {
  win_.set_title("Writing...");
  render();
  std::string msg;
  if (buf_.write_file(file_path_, msg, opts_.atomic_save)) buf_.mark_saved();
  else message_ = msg;
}

void Editor::new_line() {
  buf_.split(win_);
  win_.cursor_down();
  win_.cursor().set_column(0);
}

void Editor::backspace() {
  const Cursor& cur = win_.cursor();
  if (cur.row() == 0 && cur.col() == 0) return;
  win_.cursor_left();
  buf_.delete_char(win_);
}

void Editor::insert_key(int ch) {
  if ((ch >= 32 && ch <= 126) || ch == '\t') {
    buf_.insert(win_, std::string(1, static_cast<char>(ch)));
    return;
  }
  if (opts_.unknown_keys == UnknownKeyPolicy::InsertCode) buf_.insert(win_, std::to_string(ch));
}

#pragma once
/*
 * Editor
 *
 * Purpose: single-file editing loop: read one key, apply it to the Window /
 *          TextBuffer, recompute the title, redraw.
 * Ownership: owns the TextBuffer for the process lifetime and the Window that
 *            references it; borrows the terminal backend.
 * Keys: ^Q quit, ^W save, Enter split, arrows move, Delete/^D forward delete,
 *       Backspace, printable ASCII and Tab insert; anything else follows
 *       EditorOptions::unknown_keys.
 */
#include <filesystem>
#include <string>
#include "editor_options.hpp"
#include "file_reader.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "text_buffer.hpp"
#include "types.hpp"
#include "window.hpp"

class Editor {
public:
  Editor(ITerminal& term, const std::filesystem::path& file, const EditorOptions& opts = EditorOptions());
  Editor(const Editor&) = delete;
  Editor& operator=(const Editor&) = delete;

  /* returns the process exit code */
  int run();
  /* false when the loop has to stop */
  bool handle_key(int ch);
  void refresh_title();
  void render();

  const TextBuffer& buffer() const { return buf_; }
  Window& window() { return win_; }
  const Window& window() const { return win_; }
  ReadStatus load_status() const { return load_status_; }
  const std::string& message() const { return message_; }
  void set_message(std::string m) { message_ = std::move(m); }

  static ViewportConfig viewport_for(const TermSize& sz);

private:
  void save();
  void new_line();
  void backspace();
  void insert_key(int ch);

  ITerminal& term_;
  std::filesystem::path file_path_;
  EditorOptions opts_;
  ReadStatus load_status_ = ReadStatus::Ok;
  TextBuffer buf_;
  Window win_;
  Renderer renderer_;
  std::string message_;
};

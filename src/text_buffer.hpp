#pragma once
/*
 * TextBuffer
 *
 * Purpose: ordered lines of the open document plus the dirty flag.
 * Invariant: never empty; an empty document is a single empty line.
 * Editing: insert/delete_char/split take the Window whose cursor marks the
 *          edit point; insert is dropped when the line would reach the
 *          viewport width minus one.
 * Feature: safe writes (mkstemp beside the real file -> copy mode/owner ->
 *          fdatasync -> atomic rename); symlinks are followed, hard-linked
 *          files and files whose owner can not be kept are written in place.
 */
#include <string>
#include <vector>
#include <filesystem>
#include "file_reader.hpp"

class Window;

class TextBuffer {
public:
  TextBuffer();
  explicit TextBuffer(std::vector<std::string> lines);

  int line_count() const { return static_cast<int>(lines_.size()); }
  const std::string& line(int r) const { return lines_[static_cast<size_t>(r)]; }
  int line_length(int r) const;
  const std::vector<std::string>& lines() const { return lines_; }

  bool dirty() const { return dirty_; }
  void mark_saved() { dirty_ = false; }

  void init_from_lines(std::vector<std::string> lines);

  void insert(Window& win, const std::string& text);
  void delete_char(Window& win);
  void split(Window& win);

  std::string joined() const;

  static TextBuffer from_file(const std::filesystem::path& path, ReadStatus& status);
  bool write_file(const std::filesystem::path& path, std::string& msg, bool atomic = true) const;

private:
  void ensure_not_empty();
  bool write_in_place(const std::filesystem::path& path, std::string& msg) const;

  std::vector<std::string> lines_;
  bool dirty_ = false;
};

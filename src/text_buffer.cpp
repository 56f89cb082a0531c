#include "text_buffer.hpp"
#include "window.hpp"
#include "posix_fd.hpp"
#include <algorithm>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

TextBuffer::TextBuffer() { ensure_not_empty(); }

TextBuffer::TextBuffer(std::vector<std::string> lines) { init_from_lines(std::move(lines)); }

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void TextBuffer::init_from_lines(std::vector<std::string> lines) {
  lines_ = std::move(lines);
  ensure_not_empty();
  dirty_ = false;
}

int TextBuffer::line_length(int r) const {
  if (r < 0 || r >= line_count()) return 0;
  return static_cast<int>(lines_[static_cast<size_t>(r)].size());
}

void TextBuffer::insert(Window& win, const std::string& text) {
  Cursor& cur = win.cursor();
  int row = std::clamp(cur.row(), 0, line_count() - 1);
  const std::string& old = lines_[static_cast<size_t>(row)];
  size_t col = std::min(static_cast<size_t>(std::max(0, cur.col())), old.size());
  std::string neu = old.substr(0, col) + text + old.substr(col);
  if (static_cast<int>(neu.size()) >= win.viewport_cols() - 1) return;
  lines_[static_cast<size_t>(row)] = std::move(neu);
  dirty_ = true;
  win.cursor_right();
}

void TextBuffer::delete_char(Window& win) {
  const Cursor& cur = win.cursor();
  int last = line_count() - 1;
  int row = std::min(cur.row(), last);
  int col = cur.col();
  int len = line_length(row);
  if (col < len) {
    lines_[static_cast<size_t>(row)].erase(static_cast<size_t>(col), 1);
    dirty_ = true;
  } else if (row < last) {
    // end of a non-final line: pull the next line up
    lines_[static_cast<size_t>(row)] += lines_[static_cast<size_t>(row) + 1];
    lines_.erase(lines_.begin() + row + 1);
    dirty_ = true;
  }
}

void TextBuffer::split(Window& win) {
  const Cursor& cur = win.cursor();
  int row = std::clamp(cur.row(), 0, line_count() - 1);
  std::string& s = lines_[static_cast<size_t>(row)];
  size_t col = std::min(static_cast<size_t>(std::max(0, cur.col())), s.size());
  std::string right = s.substr(col);
  s.erase(col);
  lines_.insert(lines_.begin() + row + 1, std::move(right));
  dirty_ = true;
}

std::string TextBuffer::joined() const {
  std::string out;
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (i) out.push_back('\n');
    out += lines_[i];
  }
  return out;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, ReadStatus& status) {
  std::vector<std::string> ls;
  std::string msg;
  status = read_lines(path, ls, msg);
  if (status != ReadStatus::Ok) ls.clear();
  return TextBuffer(std::move(ls));
}

static bool write_whole(const UniqueFd& fd, const std::string& data) {
  return fd.write_all(data.data(), data.size()) && fd.sync();
}

bool TextBuffer::write_in_place(const std::filesystem::path& path, std::string& msg) const {
  UniqueFd ufd(::open(path.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  bool ok = ufd.valid() && write_whole(ufd, joined());
  if (!ufd.close()) ok = false;
  if (!ok) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg, bool atomic) const {
  // save through symlinks into the file they point at
  std::error_code ec;
  std::filesystem::path target = std::filesystem::weakly_canonical(path, ec);
  if (ec) target = path;
  if (!atomic) return write_in_place(target, msg);

  struct stat st{};
  bool exists = ::stat(target.string().c_str(), &st) == 0;
  // a rename would split hard links apart
  if (exists && st.st_nlink > 1) return write_in_place(target, msg);

  std::string tmpl = target.string() + ".XXXXXX";
  UniqueFd ufd(::mkstemp(tmpl.data()));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmpl;
    return false;
  }
  std::filesystem::path tmp(tmpl);
  auto discard_tmp = [&tmp]() {
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
  };
  mode_t mode;
  if (exists) {
    mode = st.st_mode & 07777;
  } else {
    mode_t mask = ::umask(0);
    ::umask(mask);
    mode = 0644 & ~mask;
  }
  if (exists && (st.st_uid != ::geteuid() || st.st_gid != ::getegid())
      && ::fchown(ufd.get(), st.st_uid, st.st_gid) != 0) {
    // the replacement could not keep the owner: overwrite the original instead
    ufd.reset();
    discard_tmp();
    return write_in_place(target, msg);
  }
  bool ok = ::fchmod(ufd.get(), mode) == 0 && write_whole(ufd, joined());
  if (!ufd.close()) ok = false;
  if (!ok) {
    msg = std::string("write file failed: ") + tmp.string();
    discard_tmp();
    return false;
  }
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    msg = std::string("write file failed: ") + target.string();
    discard_tmp();
    return false;
  }
  msg = std::string("saved file: ") + target.string();
  return true;
}

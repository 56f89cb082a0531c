#pragma once
/*
 * UniqueFd
 *
 * Purpose: owning POSIX file descriptor; closes on scope exit.
 * Extra: write_all() loops over short writes, sync() flushes data to disk.
 */
#include <cerrno>
#include <cstddef>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { reset(other.fd_); other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { if (fd_ >= 0) ::close(fd_); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // returns false on the first failing write (EINTR is retried)
  bool write_all(const char* p, size_t len) const {
    while (len > 0) {
      ssize_t w = ::write(fd_, p, len);
      if (w < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  }

  bool sync() const {
#if defined(__APPLE__)
    return ::fsync(fd_) == 0;
#else
    return ::fdatasync(fd_) == 0;
#endif
  }

  // closes now and reports close() failures, which can carry deferred write errors
  bool close() {
    if (fd_ < 0) return true;
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }

  void reset(int fd = -1) { if (fd_ >= 0) ::close(fd_); fd_ = fd; }

private:
  int fd_;
};

#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <cerrno>

static ReadStatus status_from_errno(int err) {
  switch (err) {
    case ENOENT:
    case ENOTDIR: return ReadStatus::NotFound;
    case EACCES:
    case EPERM: return ReadStatus::PermissionDenied;
    default: return ReadStatus::IoError;
  }
}

void split_lines(std::string_view data, std::vector<std::string>& out_lines) {
  size_t n = data.size();
  size_t start = 0;
  size_t i = 0;
  while (i < n) {
    char c = data[i];
    if (c == '\n' || c == '\r') {
      out_lines.emplace_back(data.substr(start, i - start));
      if (c == '\r' && i + 1 < n && data[i + 1] == '\n') i++;
      start = i + 1;
    }
    i++;
  }
  if (start < n) out_lines.emplace_back(data.substr(start));
}

ReadStatus read_lines(const std::filesystem::path& path,
                      std::vector<std::string>& out_lines,
                      std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) {
    ReadStatus st = status_from_errno(errno);
    msg = std::string("can not open file: ") + path.string();
    return st;
  }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) {
    msg = std::string("can not read file stat: ") + path.string();
    return ReadStatus::IoError;
  }
  if (S_ISDIR(st.st_mode)) {
    msg = std::string("is a directory: ") + path.string();
    return ReadStatus::IoError;
  }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened file: ") + path.string(); return ReadStatus::Ok; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) {
    msg = std::string("can not mmap file: ") + path.string();
    return ReadStatus::IoError;
  }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  split_lines(std::string_view(data, n), out_lines);
  ::munmap(mem, n);
  msg = std::string("opened file: ") + path.string();
  return ReadStatus::Ok;
}

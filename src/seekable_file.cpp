#include "include/seekable_file.hpp"
#include "include/errors.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

// --- FileHandle ---

FileHandle::FileHandle(const std::string &path) : path_(path) {
  fd_ = ::open(path.c_str(), O_RDONLY);
  if (fd_ < 0)
    throw IOError(errno_message("Failed to open file", path));
}

FileHandle::~FileHandle() {
  if (fd_ >= 0)
    ::close(fd_);
}

FileHandle::FileHandle(FileHandle &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

FileHandle &FileHandle::operator=(FileHandle &&other) noexcept {
  if (this != &other) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

uint64_t FileHandle::size() const {
  struct stat sbuf;
  if (fstat(fd_, &sbuf) < 0)
    throw IOError(errno_message("Failed to get length of the file", path_));
  return static_cast<uint64_t>(sbuf.st_size);
}

size_t FileHandle::read_at(uint64_t offset, char *buf, size_t len) const {
  for (;;) {
    ssize_t n = ::pread(fd_, buf, len, static_cast<off_t>(offset));
    if (n >= 0)
      return static_cast<size_t>(n);
    if (errno != EINTR)
      throw IOError(errno_message("Failed to read file", path_));
  }
}

// --- SeekableFile ---

SeekableFile::SeekableFile(const std::string &filename) : filename_(filename) {
  int fd = ::open(filename.c_str(), O_RDONLY);
  if (fd < 0)
    throw IOError(errno_message("Failed to open file", filename));

  // Process substitution and pipes fail this seek with ESPIPE
  if (::lseek(fd, 0, SEEK_SET) < 0) {
    try {
      materialize(fd);
    } catch (const IOError &) {
      ::close(fd);
      throw;
    }
  }
  ::close(fd);
}

void SeekableFile::materialize(int fd) {
  const char *tmpdir = std::getenv("TMPDIR");
  std::string tmpl = std::string((tmpdir && *tmpdir) ? tmpdir : "/tmp") +
                     "/glimpse_XXXXXX";

  int out = mkstemp(tmpl.data());
  if (out < 0)
    throw IOError(errno_message("Failed to create temporary copy", tmpl));

  auto fail = [&](const char *what, const std::string &path) {
    IOError err(errno_message(what, path));
    ::close(out);
    std::remove(tmpl.c_str());
    throw err;
  };

  constexpr size_t chunk = 1 << 16; // 64KB
  char buf[chunk];
  uint64_t copied = 0;
  for (;;) {
    ssize_t n = ::read(fd, buf, chunk);
    if (n == 0)
      break;
    if (n < 0) {
      if (errno == EINTR)
        continue;
      fail("Failed to read non-seekable input", filename_);
    }
    size_t done = 0;
    while (done < static_cast<size_t>(n)) {
      ssize_t w = ::write(out, buf + done, static_cast<size_t>(n) - done);
      if (w < 0) {
        if (errno == EINTR)
          continue;
        fail("Failed to write temporary copy", tmpl);
      }
      done += static_cast<size_t>(w);
    }
    copied += static_cast<uint64_t>(n);
  }

  if (::close(out) < 0) {
    IOError err(errno_message("Failed to write temporary copy", tmpl));
    std::remove(tmpl.c_str());
    throw err;
  }

  temp_path_ = tmpl;
  spdlog::debug("copied {} bytes of non-seekable input {} to {}", copied,
                filename_, temp_path_);
}

SeekableFile::~SeekableFile() {
  if (!temp_path_.empty())
    std::remove(temp_path_.c_str());
}

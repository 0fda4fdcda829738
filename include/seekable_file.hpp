#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

// Read-only descriptor supporting positioned reads from several threads.
class FileHandle {
private:
  int fd_ = -1;
  std::string path_;

public:
  FileHandle() = default;
  explicit FileHandle(const std::string &path);
  ~FileHandle();
  FileHandle(const FileHandle &) = delete;
  FileHandle &operator=(const FileHandle &) = delete;
  FileHandle(FileHandle &&other) noexcept;
  FileHandle &operator=(FileHandle &&other) noexcept;

  bool is_open() const { return fd_ >= 0; }
  const std::string &path() const { return path_; }

  uint64_t size() const;

  // Reads up to len bytes at offset; returns 0 at end of file.
  size_t read_at(uint64_t offset, char *buf, size_t len) const;
};

// Input normalized to something that supports random access. A pipe or other
// non-seekable input is copied into a temporary file that lives as long as
// this object.
class SeekableFile {
private:
  std::string filename_;
  std::string temp_path_;

  void materialize(int fd);

public:
  SeekableFile() = delete;
  explicit SeekableFile(const std::string &filename);
  ~SeekableFile();
  SeekableFile(const SeekableFile &) = delete;
  SeekableFile &operator=(const SeekableFile &) = delete;

  const std::string &filename() const { return filename_; }
  const std::string &effective_path() const {
    return temp_path_.empty() ? filename_ : temp_path_;
  }
  bool is_materialized() const { return !temp_path_.empty(); }
};

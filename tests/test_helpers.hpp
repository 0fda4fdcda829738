#pragma once

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

inline std::string fixture_path(const char *name) {
  return std::string(TEST_DATA_DIR) + "/" + name;
}

class TempCsv {
  std::string path_;

public:
  explicit TempCsv(const std::string &content) {
    char tmpl[] = "/tmp/glimpse_test_XXXXXX";
    int fd = mkstemp(tmpl);
    if (fd < 0)
      throw std::runtime_error("Failed to create temp file");
    path_ = tmpl;
    ssize_t written = ::write(fd, content.data(), content.size());
    (void)written;
    ::close(fd);
  }

  ~TempCsv() { std::remove(path_.c_str()); }

  TempCsv(const TempCsv &) = delete;
  TempCsv &operator=(const TempCsv &) = delete;

  const std::string &path() const { return path_; }
};

// Header "a,b,c" and rows "a<i>,b<i>,c<i>" for i in [0, n).
inline std::string numbered_csv(size_t n) {
  std::string content = "a,b,c\n";
  for (size_t i = 0; i < n; ++i) {
    auto s = std::to_string(i);
    content += "a" + s + ",b" + s + ",c" + s + "\n";
  }
  return content;
}

// Polls pred until it holds or the timeout passes; returns the last result.
template <typename Pred>
bool wait_for(Pred pred,
              std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline)
      return pred();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

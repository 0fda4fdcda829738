#pragma once

#include "include/app.hpp"
#include <cstddef>
#include <string_view>
#include <utility>

// Raw mode + alternate screen on the controlling terminal for the lifetime
// of the object.
class TerminalSession {
private:
  int tty_fd_ = -1;
  bool raw_mode_active_ = false;

  int read_byte(int timeout_ms);

public:
  TerminalSession();
  ~TerminalSession();
  TerminalSession(const TerminalSession &) = delete;
  TerminalSession &operator=(const TerminalSession &) = delete;

  // {rows, cols}
  std::pair<size_t, size_t> size() const;
  void write(std::string_view frame) const;

  // Next key press, or KEY_NONE when nothing arrived within timeout_ms.
  int read_key(int timeout_ms);
};

void run_pager(App &app);

#include "include/pager.hpp"
#include "include/errors.hpp"
#include "include/input.hpp"
#include "include/logging.hpp"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

// --- Terminal control ---

static struct termios orig_termios;

static void handle_winch(int) {}

TerminalSession::TerminalSession() {
  tty_fd_ = open("/dev/tty", O_RDONLY);
  if (tty_fd_ < 0)
    throw IOError(errno_message("Failed to open terminal", "/dev/tty"));

  if (tcgetattr(tty_fd_, &orig_termios) < 0) {
    IOError err(errno_message("Failed to read terminal attributes", "/dev/tty"));
    close(tty_fd_);
    throw err;
  }

  struct termios raw = orig_termios;
  raw.c_lflag &= ~(ECHO | ICANON | ISIG);
  raw.c_iflag &= ~(IXON | ICRNL);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  tcsetattr(tty_fd_, TCSAFLUSH, &raw);
  raw_mode_active_ = true;

  // SIGWINCH interrupts poll() so a resize redraws at once
  struct sigaction sa = {};
  sa.sa_handler = handle_winch;
  sigaction(SIGWINCH, &sa, nullptr);

  set_console_logging(false);

  // Enter alternate screen + hide cursor
  write("\033[?1049h\033[?25l");
}

TerminalSession::~TerminalSession() {
  if (raw_mode_active_)
    tcsetattr(tty_fd_, TCSAFLUSH, &orig_termios);
  // Leave alternate screen + show cursor
  write("\033[?1049l\033[?25h");
  close(tty_fd_);
  set_console_logging(true);
}

std::pair<size_t, size_t> TerminalSession::size() const {
  struct winsize w;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_row > 0)
    return {w.ws_row, w.ws_col};
  return {24, 80};
}

void TerminalSession::write(std::string_view frame) const {
  size_t done = 0;
  while (done < frame.size()) {
    ssize_t n = ::write(STDOUT_FILENO, frame.data() + done, frame.size() - done);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return; // terminal gone; the read side notices
    }
    done += static_cast<size_t>(n);
  }
}

int TerminalSession::read_byte(int timeout_ms) {
  struct pollfd pfd = {tty_fd_, POLLIN, 0};
  if (poll(&pfd, 1, timeout_ms) <= 0)
    return KEY_NONE;
  unsigned char c;
  if (read(tty_fd_, &c, 1) != 1)
    return KEY_NONE;
  return c;
}

// --- Key decoding ---

int TerminalSession::read_key(int timeout_ms) {
  int c = read_byte(timeout_ms);
  if (c != KEY_ESC)
    return c;

  // Escape sequences arrive in one burst; a lone ESC does not
  constexpr int seq_timeout = 20;
  return decode_escape([this] { return read_byte(seq_timeout); });
}

// --- Frame loop ---

void run_pager(App &app) {
  TerminalSession term;

  // Redraw at least this often so search progress shows without input
  constexpr int tick_ms = 100;

  for (;;) {
    auto [rows, cols] = term.size();
    term.write(app.render(rows, cols));

    int key = term.read_key(tick_ms);
    if (!app.handle_key(key))
      break;
  }
}

#include "include/input.hpp"
#include <cstdlib>

static bool is_digit(int key) { return key >= '0' && key <= '9'; }
static bool is_printable(int key) { return key >= 32 && key < 127; }
static bool is_enter(int key) { return key == '\r' || key == '\n'; }
static bool is_backspace(int key) {
  return key == KEY_BACKSPACE_K || key == KEY_BS;
}

// --- Escape sequences ---

int decode_escape(const std::function<int()> &next) {
  int s0 = next();
  if (s0 == KEY_NONE)
    return KEY_ESC;

  if (s0 == 'O') {
    switch (next()) {
    case 'H':
      return KEY_HOME;
    case 'F':
      return KEY_END;
    default:
      return KEY_NONE;
    }
  }
  if (s0 != '[')
    return KEY_NONE; // Alt+key

  // CSI: parameter bytes up to a final byte in 0x40-0x7E
  std::string params;
  int final_byte = KEY_NONE;
  for (;;) {
    int c = next();
    if (c == KEY_NONE || params.size() > 16)
      return KEY_NONE;
    if (c >= 0x40 && c <= 0x7e) {
      final_byte = c;
      break;
    }
    params += static_cast<char>(c);
  }

  if (params.empty()) {
    switch (final_byte) {
    case 'A':
      return KEY_UP;
    case 'B':
      return KEY_DOWN;
    case 'C':
      return KEY_RIGHT;
    case 'D':
      return KEY_LEFT;
    case 'H':
      return KEY_HOME;
    case 'F':
      return KEY_END;
    default:
      return KEY_NONE;
    }
  }
  if (final_byte == '~') {
    if (params == "5")
      return KEY_PGUP;
    if (params == "6")
      return KEY_PGDN;
    if (params == "1" || params == "7")
      return KEY_HOME;
    if (params == "4" || params == "8")
      return KEY_END;
  }
  return KEY_NONE;
}

Control InputHandler::reset() {
  mode_ = InputMode::Default;
  buffer_.clear();
  return Control::of(ControlKind::BufferReset);
}

Control InputHandler::handle_key(int key) {
  if (key == KEY_NONE)
    return Control::of(ControlKind::Nothing);
  if (key == KEY_CTRL_C)
    return Control::of(ControlKind::Quit);

  switch (mode_) {
  case InputMode::Default:
    return handle_default(key);
  case InputMode::GotoLine:
    return handle_goto_line(key);
  case InputMode::Find:
  case InputMode::Filter:
    return handle_text(key);
  }
  return Control::of(ControlKind::Nothing);
}

Control InputHandler::handle_default(int key) {
  if (is_digit(key)) {
    mode_ = InputMode::GotoLine;
    buffer_.assign(1, static_cast<char>(key));
    return Control::with_text(ControlKind::BufferContent, buffer_);
  }

  switch (key) {
  case 'q':
    return Control::of(ControlKind::Quit);
  case 'j':
  case KEY_DOWN:
    return Control::of(ControlKind::ScrollDown);
  case 'k':
  case KEY_UP:
    return Control::of(ControlKind::ScrollUp);
  case ' ':
  case KEY_PGDN:
    return Control::of(ControlKind::ScrollPageDown);
  case 'b':
  case KEY_PGUP:
    return Control::of(ControlKind::ScrollPageUp);
  case 'g':
  case KEY_HOME:
    return Control::of(ControlKind::ScrollTop);
  case 'G':
  case KEY_END:
    return Control::of(ControlKind::ScrollBottom);
  case 'h':
  case KEY_LEFT:
    return Control::of(ControlKind::ScrollLeft);
  case 'l':
  case KEY_RIGHT:
    return Control::of(ControlKind::ScrollRight);
  case 'n':
    return Control::of(ControlKind::ScrollToNextFound);
  case 'N':
    return Control::of(ControlKind::ScrollToPrevFound);
  case '/':
    mode_ = InputMode::Find;
    buffer_.clear();
    return Control::with_text(ControlKind::BufferContent, buffer_);
  case '&':
    mode_ = InputMode::Filter;
    buffer_.clear();
    return Control::with_text(ControlKind::BufferContent, buffer_);
  case KEY_ESC:
    return reset();
  default:
    return Control::of(ControlKind::Nothing);
  }
}

Control InputHandler::handle_goto_line(int key) {
  if (is_digit(key)) {
    buffer_ += static_cast<char>(key);
    return Control::with_text(ControlKind::BufferContent, buffer_);
  }
  if (is_backspace(key)) {
    buffer_.pop_back();
    if (buffer_.empty())
      return reset();
    return Control::with_text(ControlKind::BufferContent, buffer_);
  }
  if (key == 'G' || is_enter(key)) {
    // Line numbers on screen are 1-based
    unsigned long long line = std::strtoull(buffer_.c_str(), nullptr, 10);
    mode_ = InputMode::Default;
    buffer_.clear();
    return Control::scroll_to(line > 0 ? static_cast<size_t>(line - 1) : 0);
  }
  return reset();
}

Control InputHandler::handle_text(int key) {
  if (key == KEY_ESC)
    return reset();

  if (is_enter(key)) {
    if (buffer_.empty())
      return reset();
    ControlKind kind =
        (mode_ == InputMode::Find) ? ControlKind::Find : ControlKind::Filter;
    std::string pattern = std::move(buffer_);
    mode_ = InputMode::Default;
    buffer_.clear();
    return Control::with_text(kind, std::move(pattern));
  }

  if (is_backspace(key)) {
    if (!buffer_.empty())
      buffer_.pop_back();
  } else if (is_printable(key)) {
    buffer_ += static_cast<char>(key);
  } else {
    return Control::of(ControlKind::Nothing);
  }
  return Control::with_text(ControlKind::BufferContent, buffer_);
}

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

// --- Key constants ---

enum Key {
  KEY_NONE = -1,
  KEY_CTRL_C = 3,
  KEY_BS = 8,
  KEY_ESC = 27,
  KEY_BACKSPACE_K = 127,
  KEY_UP = 1000,
  KEY_DOWN,
  KEY_LEFT,
  KEY_RIGHT,
  KEY_PGUP,
  KEY_PGDN,
  KEY_HOME,
  KEY_END,
};

// Decodes what follows an ESC byte. next returns the following byte, or
// KEY_NONE when none arrives in time. A lone ESC gives KEY_ESC; a complete
// but unknown sequence is consumed and gives KEY_NONE.
int decode_escape(const std::function<int()> &next);

// --- Commands ---

enum class ControlKind {
  Nothing,
  Quit,
  ScrollUp,
  ScrollDown,
  ScrollPageUp,
  ScrollPageDown,
  ScrollTop,
  ScrollBottom,
  ScrollTo, // position: 0-based row (match index in filter mode)
  ScrollLeft,
  ScrollRight,
  ScrollToNextFound,
  ScrollToPrevFound,
  Find,          // text: pattern
  Filter,        // text: pattern
  BufferContent, // text: what has been typed so far
  BufferReset,
};

struct Control {
  ControlKind kind = ControlKind::Nothing;
  size_t position = 0;
  std::string text;

  static Control of(ControlKind kind) { return {kind, 0, {}}; }
  static Control scroll_to(size_t position) {
    return {ControlKind::ScrollTo, position, {}};
  }
  static Control with_text(ControlKind kind, std::string text) {
    return {kind, 0, std::move(text)};
  }
};

// --- Input state machine ---

enum class InputMode { Default, GotoLine, Find, Filter };

// Turns single key presses into commands. Multi-key commands (a line number,
// a search pattern) are collected in a buffer whose every change is reported
// as BufferContent.
class InputHandler {
private:
  InputMode mode_ = InputMode::Default;
  std::string buffer_;

  Control handle_default(int key);
  Control handle_goto_line(int key);
  Control handle_text(int key);
  Control reset();

public:
  InputMode mode() const { return mode_; }
  const std::string &buffer() const { return buffer_; }

  Control handle_key(int key);
};

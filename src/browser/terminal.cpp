/**
 * @file terminal.cpp
 * @brief POSIX raw-mode terminal and input decoding.
 */

#include "browser/terminal.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace chordmap {

namespace {

constexpr char kEsc = '\x1b';
constexpr char kDel = '\x7f';

constexpr const char* kEnterAltScreen = "\033[?1049h";
constexpr const char* kLeaveAltScreen = "\033[?1049l";

}  // namespace

std::vector<KeyEvent> decodeKeys(const std::string& bytes) {
  std::vector<KeyEvent> keys;
  size_t i = 0;
  while (i < bytes.size()) {
    char c = bytes[i];

    if (c == kEsc) {
      if (i + 2 < bytes.size() && bytes[i + 1] == '[') {
        char final_byte = bytes[i + 2];
        if (final_byte == 'A') {
          keys.push_back(KeyEvent::special(KeyCode::Up));
          i += 3;
        } else if (final_byte == 'B') {
          keys.push_back(KeyEvent::special(KeyCode::Down));
          i += 3;
        } else if (final_byte >= '0' && final_byte <= '9') {
          // ESC [ <params> <final>; ESC [ 3 ~ is Delete
          auto is_param = [](char b) { return (b >= '0' && b <= '9') || b == ';'; };
          size_t end = i + 2;
          while (end < bytes.size() && is_param(bytes[end])) ++end;
          bool is_delete = end < bytes.size() && bytes[end] == '~' &&
                           bytes.compare(i + 2, end - i - 2, "3") == 0;
          keys.push_back(KeyEvent::special(is_delete ? KeyCode::Delete : KeyCode::Other));
          i = std::min(end + 1, bytes.size());
        } else {
          keys.push_back(KeyEvent::special(KeyCode::Other));
          i += 3;
        }
      } else {
        keys.push_back(KeyEvent::special(KeyCode::Escape));
        ++i;
      }
      continue;
    }

    if (c == kDel) {
      keys.push_back(KeyEvent::special(KeyCode::Backspace));
    } else if (c == '\r' || c == '\n') {
      keys.push_back(KeyEvent::special(KeyCode::Enter));
    } else if (c >= 0x01 && c <= 0x1a) {
      keys.push_back(KeyEvent::control(static_cast<char>('a' + c - 1)));
    } else if (static_cast<unsigned char>(c) >= 0x20) {
      keys.push_back(KeyEvent::character(c));
    } else {
      keys.push_back(KeyEvent::special(KeyCode::Other));
    }
    ++i;
  }
  return keys;
}

struct TerminalSession::SavedState {
  termios original{};
};

TerminalSession::TerminalSession() : saved_(std::make_unique<SavedState>()) {}

TerminalSession::~TerminalSession() { close(); }

bool TerminalSession::open() {
  if (active_) return true;

  if (!isatty(STDIN_FILENO)) {
    error_ = "stdin is not a terminal";
    return false;
  }
  if (tcgetattr(STDIN_FILENO, &saved_->original) != 0) {
    error_ = std::string("tcgetattr failed: ") + std::strerror(errno);
    return false;
  }

  termios raw = saved_->original;
  raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
  raw.c_oflag &= ~static_cast<tcflag_t>(OPOST);
  raw.c_cflag |= CS8;
  raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
    error_ = std::string("tcsetattr failed: ") + std::strerror(errno);
    return false;
  }

  active_ = true;
  return write(kEnterAltScreen);
}

void TerminalSession::close() {
  if (!active_) return;
  active_ = false;
  bool left_screen = write(kLeaveAltScreen);
  if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_->original) != 0) {
    error_ = std::string("tcsetattr failed: ") + std::strerror(errno);
  } else if (!left_screen) {
    error_ = "Failed to leave alternate screen";
  }
}

std::string TerminalSession::read() {
  char buf[64];
  ssize_t n;
  do {
    n = ::read(STDIN_FILENO, buf, sizeof(buf));
  } while (n < 0 && errno == EINTR);

  if (n <= 0) return std::string();
  return std::string(buf, static_cast<size_t>(n));
}

bool TerminalSession::write(const std::string& bytes) {
  size_t written = 0;
  while (written < bytes.size()) {
    ssize_t n = ::write(STDOUT_FILENO, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      error_ = std::string("write failed: ") + std::strerror(errno);
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

void TerminalSession::size(size_t& width, size_t& height) const {
  winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
    width = ws.ws_col;
    height = ws.ws_row;
  } else {
    width = 80;
    height = 24;
  }
}

}  // namespace chordmap

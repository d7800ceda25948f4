/**
 * @file terminal.h
 * @brief Raw-mode terminal session and key decoding (POSIX).
 */

#ifndef CHORDMAP_BROWSER_TERMINAL_H
#define CHORDMAP_BROWSER_TERMINAL_H

#include <memory>
#include <string>
#include <vector>

#include "browser/browser_model.h"

namespace chordmap {

/**
 * @brief Decode raw terminal input bytes into key events.
 *
 * Handles printable characters, DEL (0x7f) as Backspace, CR/LF as Enter,
 * control bytes as Ctrl+letter (0x03 is Ctrl+C, 0x08 is Ctrl+H) and the
 * ESC [ A / ESC [ B arrow sequences. ESC [ 3 ~ is Delete; other escape
 * sequences decode as KeyCode::Other.
 */
std::vector<KeyEvent> decodeKeys(const std::string& bytes);

/**
 * @brief Puts stdin/stdout into raw mode on the alternate screen.
 *
 * The previous terminal state is restored by the destructor.
 */
class TerminalSession {
 public:
  TerminalSession();
  ~TerminalSession();

  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  /**
   * @brief Enter raw mode.
   * @return false if stdin is not a terminal (see getError())
   */
  bool open();

  /// @brief Leave raw mode and the alternate screen. Safe to call twice.
  void close();

  /// @brief Block until input is available and return the bytes read.
  /// An empty string means end of input.
  std::string read();

  /// @brief Write bytes to the terminal.
  bool write(const std::string& bytes);

  /// @brief Current size in columns/lines (80x24 if unknown).
  void size(size_t& width, size_t& height) const;

  const std::string& getError() const { return error_; }

 private:
  struct SavedState;
  std::unique_ptr<SavedState> saved_;
  bool active_ = false;
  std::string error_;
};

}  // namespace chordmap

#endif  // CHORDMAP_BROWSER_TERMINAL_H

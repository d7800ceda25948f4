/**
 * @file browser_view.cpp
 * @brief Browser frame layout and ANSI output.
 */

#include "browser/browser_view.h"

#include <algorithm>

#include "core/text_utils.h"

namespace chordmap {

namespace {

constexpr const char* kSearchTitle = " Search chords ";
constexpr const char* kCaptureTitle = " Chord for ";
constexpr size_t kSearchBoxLines = 3;
constexpr size_t kTableChromeLines = 3;  // top border, header, bottom border

// ANSI sequences
constexpr const char* kReset = "\033[0m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kReverse = "\033[7m";
constexpr const char* kClearScreen = "\033[H\033[2J";
constexpr const char* kClearLine = "\033[K";

// Cut to at most `width` columns on a character boundary and pad with `fill`.
// One column per code point.
std::string fit(const std::string& text, size_t width, char fill) {
  std::string out = utf8Prefix(text, width);
  out.append(width - utf8Length(out), fill);
  return out;
}

// Truncate or pad to exactly `width` columns, keeping one trailing space.
std::string cell(const std::string& text, size_t width) {
  if (width == 0) return std::string();
  return fit(utf8Prefix(text, width - 1), width, ' ');
}

std::string boxed(const std::string& content, size_t inner) {
  return "|" + fit(content, inner, ' ') + "|";
}

std::string border(size_t inner) { return "+" + std::string(inner, '-') + "+"; }

std::string titledBorder(const std::string& title, size_t inner) {
  return "+" + fit(title, inner, '-') + "+";
}

std::string tableLine(const std::string& rank, const std::string& word, const std::string& chord,
                      size_t inner) {
  size_t col = inner / 3;
  return "|" + cell(rank, col) + cell(word, col) + cell(chord, inner - 2 * col) + "|";
}

}  // namespace

BrowserFrame layoutBrowser(const BrowserModel& model, size_t width, size_t height) {
  width = std::max(width, kMinFrameWidth);
  height = std::max(height, kMinFrameHeight);
  const size_t inner = width - 2;

  BrowserFrame frame;
  auto& lines = frame.lines;
  lines.reserve(height);

  // Input box: the search text, or the chord being captured for a word. A
  // long input shows its tail so the cursor stays in view.
  std::string title = kSearchTitle;
  std::string input = model.search();
  if (model.mode() == BrowserMode::Capture) {
    title = kCaptureTitle + model.captureWord() + " ";
    input = model.pendingChord().str();
  }
  lines.push_back(titledBorder(title, inner));

  size_t shown = std::min(utf8Length(input), inner);
  lines.push_back(boxed(utf8Suffix(input, shown), inner));
  lines.push_back(border(inner));
  frame.cursor_row = 2;
  frame.cursor_col = 2 + shown;

  // Result table
  lines.push_back(border(inner));
  frame.header_line = lines.size();
  lines.push_back(tableLine("Rank", "Word", "Chord", inner));

  const auto& rows = model.rows();
  const size_t visible = height - kSearchBoxLines - kTableChromeLines;
  size_t offset = 0;
  auto selected = model.selected();
  if (selected && *selected >= visible) {
    offset = *selected - visible + 1;
  }

  for (size_t i = 0; i < visible; ++i) {
    size_t index = offset + i;
    if (index < rows.size()) {
      if (selected && *selected == index) {
        frame.highlighted_line = lines.size();
      }
      const auto& row = rows[index];
      lines.push_back(tableLine(row.rank, row.word, row.chord, inner));
    } else {
      lines.push_back(boxed(std::string(), inner));
    }
  }
  if (model.status().empty()) {
    lines.push_back(border(inner));
  } else {
    lines.push_back(titledBorder(" " + model.status() + " ", inner));
  }

  return frame;
}

std::string renderFrame(const BrowserFrame& frame) {
  std::string out = kClearScreen;
  for (size_t i = 0; i < frame.lines.size(); ++i) {
    if (i > 0) out += "\r\n";
    if (i == frame.header_line) {
      out += kBold + frame.lines[i] + kReset;
    } else if (frame.highlighted_line && *frame.highlighted_line == i) {
      out += kReverse + frame.lines[i] + kReset;
    } else {
      out += frame.lines[i];
    }
    out += kClearLine;
  }
  out += "\033[" + std::to_string(frame.cursor_row) + ";" + std::to_string(frame.cursor_col) + "H";
  return out;
}

}  // namespace chordmap

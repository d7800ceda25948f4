/**
 * @file browser_view.h
 * @brief Text layout and ANSI rendering of the chord browser.
 */

#ifndef CHORDMAP_BROWSER_BROWSER_VIEW_H
#define CHORDMAP_BROWSER_BROWSER_VIEW_H

#include <optional>
#include <string>
#include <vector>

#include "browser/browser_model.h"

namespace chordmap {

/// Smallest frame the layout will produce.
constexpr size_t kMinFrameWidth = 16;
constexpr size_t kMinFrameHeight = 7;

/**
 * @brief A laid-out browser screen without terminal escapes.
 *
 * Lines 0-2 hold the input box, the rest the result table. Cursor
 * coordinates are 1-based, as used by the terminal. Widths count one column
 * per UTF-8 character.
 */
struct BrowserFrame {
  std::vector<std::string> lines;
  size_t header_line = 0;                  ///< Table header ("Rank Word Chord")
  std::optional<size_t> highlighted_line;  ///< Selected row, if visible
  size_t cursor_row = 2;
  size_t cursor_col = 2;
};

/**
 * @brief Lay out the browser for a terminal of the given size.
 *
 * The input box shows the search text, or in capture mode the pending chord
 * under a "Chord for <word>" title. The table has three equal-width columns.
 * When there are more rows than fit, the view scrolls so that the selected
 * row stays visible. A status message is drawn into the bottom border.
 *
 * @param model Browser state
 * @param width Terminal width in columns
 * @param height Terminal height in lines
 * @return Frame with exactly max(height, kMinFrameHeight) lines
 */
BrowserFrame layoutBrowser(const BrowserModel& model, size_t width, size_t height);

/// @brief Full-screen ANSI output for a frame (bold header, reversed selection).
std::string renderFrame(const BrowserFrame& frame);

}  // namespace chordmap

#endif  // CHORDMAP_BROWSER_BROWSER_VIEW_H

/**
 * @file browser_model.h
 * @brief Search/selection state behind the interactive chord browser.
 */

#ifndef CHORDMAP_BROWSER_BROWSER_MODEL_H
#define CHORDMAP_BROWSER_BROWSER_MODEL_H

#include <optional>
#include <string>
#include <vector>

#include "core/chord_dictionary.h"
#include "core/word_ranking.h"

namespace chordmap {

/// @brief Key codes the browser reacts to.
enum class KeyCode { Char, Backspace, Delete, Up, Down, Enter, Escape, Other };

/// @brief What typed characters go to.
enum class BrowserMode {
  Search,  ///< Characters edit the search text
  Capture  ///< Characters are keys of a chord for the selected word
};

/**
 * @brief A decoded key press.
 *
 * `ch` is meaningful only for KeyCode::Char. With `ctrl` set, `ch` holds the
 * lowercase letter ('c' for Ctrl+C).
 */
struct KeyEvent {
  KeyCode code = KeyCode::Other;
  char ch = '\0';
  bool ctrl = false;
  bool press = true;  ///< false for release/repeat events, which are ignored

  static KeyEvent character(char c) { return {KeyCode::Char, c, false, true}; }
  static KeyEvent control(char c) { return {KeyCode::Char, c, true, true}; }
  static KeyEvent special(KeyCode code) { return {code, '\0', false, true}; }
};

/// @brief One displayed table row. Empty strings for a missing rank/chord.
struct BrowserRow {
  std::string rank;
  std::string word;
  std::string chord;
};

/**
 * @brief Rows, search text and selection of the chord browser.
 *
 * Rows list ranked words first (in rank order), then dictionary words that
 * have no rank (in chord order). A row is shown when its word contains the
 * search text.
 *
 * Enter on a selected row starts capturing a chord for its word: typed
 * letters are added to a pending chord, Enter binds it, Escape cancels.
 * Delete removes the chord shown on the selected row. Edits go straight to
 * the dictionary and are flagged for the caller to save (takeModified()).
 * The dictionary and ranking must outlive the model.
 */
class BrowserModel {
 public:
  BrowserModel(ChordDictionary& dictionary, const WordRanking* ranking = nullptr);

  /// @brief Rebuild rows from the dictionary and ranking.
  void refresh();

  /**
   * @brief Apply a key press.
   * @return true if the browser should quit (Ctrl+C)
   */
  bool handleKey(const KeyEvent& key);

  void setSearch(const std::string& search);
  const std::string& search() const { return search_; }

  const std::vector<BrowserRow>& rows() const { return rows_; }

  std::optional<size_t> selected() const { return selected_; }
  const BrowserRow* selectedRow() const;

  void selectPrevious();
  void selectNext();

  BrowserMode mode() const { return mode_; }

  /// @brief Chord typed so far in capture mode.
  const Chord& pendingChord() const { return pending_; }

  /// @brief Word the pending chord will be bound to.
  const std::string& captureWord() const { return capture_word_; }

  /// @brief Outcome of the last edit or rejected key (empty if none).
  const std::string& status() const { return status_; }

  /// @brief true if the dictionary changed since the last call.
  bool takeModified();

 private:
  void handleSearchKey(const KeyEvent& key);
  void handleCaptureKey(const KeyEvent& key);
  void startCapture();
  void commitCapture();
  void cancelCapture();
  void removeSelectedChord();

  ChordDictionary& dictionary_;
  const WordRanking* ranking_;
  std::string search_;
  std::vector<BrowserRow> rows_;
  std::optional<size_t> selected_;

  BrowserMode mode_ = BrowserMode::Search;
  Chord pending_;
  std::string capture_word_;
  std::string status_;
  bool modified_ = false;
};

}  // namespace chordmap

#endif  // CHORDMAP_BROWSER_BROWSER_MODEL_H

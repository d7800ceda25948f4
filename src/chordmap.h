/**
 * @file chordmap.h
 * @brief High-level API for editing a chord dictionary file.
 */

#ifndef CHORDMAP_H
#define CHORDMAP_H

#include <optional>
#include <string>

#include "core/chord.h"
#include "core/chord_dictionary.h"

namespace chordmap {

/**
 * @brief A ChordDictionary bound to a fixed file path.
 *
 * Chord arguments are textual expressions ("a+k", "K + A") parsed with
 * Chord::parse(). Methods returning bool leave a message in getError()
 * when they fail.
 */
class ChordMap {
 public:
  explicit ChordMap(std::string path);

  /**
   * @brief Load the bound file.
   *
   * A file that does not exist yet loads as an empty dictionary.
   * @return true on success, false on I/O error
   */
  bool load();

  /// @brief Write the dictionary back to the bound file.
  bool save();

  /**
   * @brief Bind a chord to a word, replacing any previous binding.
   * @param chord_text Chord expression
   * @param word Word to bind (trimmed; must be a single non-blank line)
   * @param previous Receives the word the chord was bound to before, if any
   * @return false if the chord does not parse, is empty or has keys other
   *         than A-Z, or if the word is blank or spans several lines
   */
  bool rebind(const std::string& chord_text, const std::string& word,
              std::optional<std::string>& previous);

  /**
   * @brief Remove a chord binding.
   * @param chord_text Chord expression
   * @param removed Receives the removed word (nullopt if the chord was unbound)
   * @return false if the chord does not parse
   */
  bool unbind(const std::string& chord_text, std::optional<std::string>& removed);

  /**
   * @brief Look up the word bound to a chord.
   * @param chord_text Chord expression
   * @param word Receives the bound word, if any
   * @return false if the chord does not parse
   */
  bool lookup(const std::string& chord_text, std::optional<std::string>& word) const;

  const ChordDictionary& dictionary() const { return dictionary_; }
  ChordDictionary& dictionary() { return dictionary_; }
  const std::string& path() const { return path_; }
  const std::string& getError() const { return error_; }

  /// @brief Library version string.
  static const char* version();

 private:
  bool parseChord(const std::string& chord_text, Chord& chord) const;

  std::string path_;
  ChordDictionary dictionary_;
  mutable std::string error_;
};

}  // namespace chordmap

#endif  // CHORDMAP_H

/**
 * @file chord_dictionary.h
 * @brief Ordered Chord to word mapping with text file persistence.
 */

#ifndef CHORDMAP_CORE_CHORD_DICTIONARY_H
#define CHORDMAP_CORE_CHORD_DICTIONARY_H

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/chord.h"

namespace chordmap {

/// A (chord, word) pair as yielded by ChordDictionary::entries().
using DictionaryEntry = std::pair<Chord, std::string>;

/**
 * @brief Chord to word dictionary.
 *
 * Entries are kept in ascending canonical-chord order. The file format is
 * one record per line:
 *
 *     A+D+K: word
 *
 * Loading is best-effort: lines without ':', with an unparsable chord or
 * with an empty word are skipped. Only I/O failures are reported.
 */
class ChordDictionary {
 public:
  /**
   * @brief Replace the contents with the records of a dictionary file.
   * @param path File to read
   * @return true on success, false if the file could not be read
   *         (contents are left untouched, see getError())
   */
  bool load(const std::string& path);

  /**
   * @brief Replace the contents with the records in a text buffer.
   * @param text Dictionary file content
   * @return Number of entries loaded
   */
  size_t loadFromString(const std::string& text);

  /**
   * @brief Write every entry to a file, replacing it.
   *
   * The text is written to "<path>.tmp" and renamed over the destination,
   * so the previous file survives a failed write.
   *
   * @param path Destination file
   * @return true on success, false on I/O error (see getError())
   */
  bool save(const std::string& path);

  /// @brief Serialized file content, one "<chord>: <word>\n" line per entry.
  std::string toText() const;

  /**
   * @brief Bind a chord to a word.
   *
   * The word is normalized with normalizeWord() first. A word that cannot be
   * stored as one record is rejected and the dictionary is left unchanged.
   *
   * @return The word previously bound to the chord, if any
   */
  std::optional<std::string> insert(const Chord& chord, std::string word);

  /**
   * @brief Trim a word in place and check that it fits in one record.
   * @return false if the word is blank or contains a line break
   */
  static bool normalizeWord(std::string& word);

  /**
   * @brief Remove a chord binding. Does nothing if the chord is absent.
   * @return The removed word, if any
   */
  std::optional<std::string> remove(const Chord& chord);

  std::optional<std::string> find(const Chord& chord) const;

  /// @brief First chord (in ascending order) bound to exactly this word.
  std::optional<Chord> findChordFor(const std::string& word) const;

  /// @brief Snapshot of all entries in ascending chord order.
  std::vector<DictionaryEntry> entries() const;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  void clear() { entries_.clear(); }

  /// @brief Error message from the last failed load() or save().
  const std::string& getError() const { return error_; }

 private:
  std::map<Chord, std::string> entries_;
  std::string error_;
};

}  // namespace chordmap

#endif  // CHORDMAP_CORE_CHORD_DICTIONARY_H

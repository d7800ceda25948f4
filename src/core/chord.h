/**
 * @file chord.h
 * @brief Canonical key-combination value type.
 */

#ifndef CHORDMAP_CORE_CHORD_H
#define CHORDMAP_CORE_CHORD_H

#include <string>
#include <vector>

namespace chordmap {

/// Separator between keys in the canonical chord string.
constexpr char kChordKeySeparator = '+';

/// Separator between chord and word in dictionary records; never a key.
constexpr char kChordWordSeparator = ':';

/// @brief Reason a chord expression was rejected.
enum class ChordParseError {
  None,            ///< Parsed successfully
  InvalidKeyToken,  ///< A '+'-separated segment is not exactly one character
  ReservedKey       ///< The key is the record separator ':'
};

struct ChordParseResult;

/**
 * @brief Set of distinct keys pressed together.
 *
 * A key is one UTF-8 encoded character; ASCII letters are kept uppercase.
 * Keys are unique and in ascending code point order. The canonical string
 * joins them with '+' ("A+D+K"); the empty chord renders as "". Chords
 * compare by their canonical string, so "A+B" sorts before "B".
 */
class Chord {
 public:
  Chord() = default;

  /**
   * @brief Parse a textual chord expression such as " b + a ".
   *
   * Each '+'-separated segment is trimmed and must be a single character
   * (one UTF-8 code point) other than ':'. ASCII letters are upper-cased
   * and repeated keys are merged. Blank input yields the empty chord.
   *
   * @param text Chord expression
   * @return Parse result holding the chord or an error
   */
  static ChordParseResult parse(const std::string& text);

  /**
   * @brief Add a key in sorted position.
   *
   * The key is upper-cased first. Non-letters and keys already present are
   * rejected without touching the chord.
   *
   * @param key Key character
   * @return true if the chord changed
   */
  bool insert(char key);

  /// @brief Canonical '+'-joined form.
  std::string str() const;

  /// @brief Keys in ascending order, one UTF-8 character each.
  const std::vector<std::string>& keys() const { return keys_; }

  /// @brief Case-insensitive membership test.
  bool contains(char key) const;

  /// @brief true if every key is a letter A-Z, i.e. could be typed with insert().
  bool lettersOnly() const;

  size_t size() const { return keys_.size(); }
  bool empty() const { return keys_.empty(); }
  void clear() { keys_.clear(); }

  // UTF-8 is prefix-free and byte order is code point order, so comparing
  // key sequences key by key orders chords exactly as comparing their
  // canonical strings does.
  bool operator==(const Chord& other) const { return keys_ == other.keys_; }
  bool operator!=(const Chord& other) const { return keys_ != other.keys_; }
  bool operator<(const Chord& other) const { return keys_ < other.keys_; }
  bool operator>(const Chord& other) const { return other < *this; }
  bool operator<=(const Chord& other) const { return !(other < *this); }
  bool operator>=(const Chord& other) const { return !(*this < other); }

 private:
  std::vector<std::string> keys_;  ///< Ascending, unique
};

/// @brief Outcome of Chord::parse().
struct ChordParseResult {
  Chord chord;                                 ///< Parsed chord (empty on error)
  ChordParseError error = ChordParseError::None;
  std::string message;                         ///< Human-readable reason on error

  bool ok() const { return error == ChordParseError::None; }
};

}  // namespace chordmap

#endif  // CHORDMAP_CORE_CHORD_H

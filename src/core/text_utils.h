/**
 * @file text_utils.h
 * @brief Small string helpers shared by the text file readers.
 */

#ifndef CHORDMAP_CORE_TEXT_UTILS_H
#define CHORDMAP_CORE_TEXT_UTILS_H

#include <cctype>
#include <string>
#include <vector>

namespace chordmap {

/// @brief Strip leading and trailing whitespace (including '\r').
inline std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

/**
 * @brief Split on every occurrence of a delimiter.
 *
 * Empty fields are kept, so "a++b" split on '+' yields {"a", "", "b"} and
 * the empty string yields a single empty field.
 */
inline std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> fields;
  size_t start = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == delim) {
      fields.push_back(s.substr(start, i - start));
      start = i + 1;
    }
  }
  fields.push_back(s.substr(start));
  return fields;
}

// ============================================================================
// UTF-8
// ============================================================================

/// @brief Byte length of the UTF-8 sequence introduced by `lead` (0 if invalid).
inline size_t utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return lead >= 0xC2 ? 2 : 0;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return lead <= 0xF4 ? 4 : 0;
  return 0;
}

/**
 * @brief Byte length of the code point starting at `pos`.
 *
 * Malformed or truncated sequences count as a single byte, so iteration
 * always makes progress.
 */
inline size_t utf8CharLength(const std::string& s, size_t pos) {
  size_t len = utf8SequenceLength(static_cast<unsigned char>(s[pos]));
  if (len == 0 || pos + len > s.size()) return 1;
  for (size_t k = 1; k < len; ++k) {
    if ((static_cast<unsigned char>(s[pos + k]) & 0xC0) != 0x80) return 1;
  }
  return len;
}

/// @brief true if `s` is exactly one well-formed UTF-8 code point.
inline bool isSingleCodePoint(const std::string& s) {
  if (s.empty()) return false;
  size_t len = utf8SequenceLength(static_cast<unsigned char>(s[0]));
  return len != 0 && len == s.size() && utf8CharLength(s, 0) == len;
}

/// @brief Number of code points in `s`.
inline size_t utf8Length(const std::string& s) {
  size_t count = 0;
  for (size_t i = 0; i < s.size(); i += utf8CharLength(s, i)) ++count;
  return count;
}

/// @brief First `count` code points of `s`.
inline std::string utf8Prefix(const std::string& s, size_t count) {
  size_t i = 0;
  for (; i < s.size() && count > 0; --count) i += utf8CharLength(s, i);
  return s.substr(0, i);
}

/// @brief Last `count` code points of `s`.
inline std::string utf8Suffix(const std::string& s, size_t count) {
  size_t total = utf8Length(s);
  if (count >= total) return s;
  return s.substr(utf8Prefix(s, total - count).size());
}

}  // namespace chordmap

#endif  // CHORDMAP_CORE_TEXT_UTILS_H

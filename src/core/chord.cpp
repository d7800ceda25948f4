/**
 * @file chord.cpp
 * @brief Chord parsing and canonical key insertion.
 */

#include "core/chord.h"

#include <algorithm>
#include <set>

#include "core/text_utils.h"

namespace chordmap {

namespace {

char foldKey(char key) {
  return (key >= 'a' && key <= 'z') ? static_cast<char>(key - 'a' + 'A') : key;
}

std::string foldKey(const std::string& key) {
  return key.size() == 1 ? std::string(1, foldKey(key[0])) : key;
}

bool isLetterKey(const std::string& key) {
  return key.size() == 1 && key[0] >= 'A' && key[0] <= 'Z';
}

}  // namespace

ChordParseResult Chord::parse(const std::string& text) {
  ChordParseResult result;

  if (trim(text).empty()) {
    return result;
  }

  std::set<std::string> keys;
  for (const auto& segment : split(text, kChordKeySeparator)) {
    std::string token = trim(segment);
    if (!isSingleCodePoint(token)) {
      result.error = ChordParseError::InvalidKeyToken;
      result.message = "Invalid key token '" + token + "' in chord '" + text + "'";
      return result;
    }
    if (token[0] == kChordWordSeparator) {
      result.error = ChordParseError::ReservedKey;
      result.message = "Key '" + token + "' is reserved in chord '" + text + "'";
      return result;
    }
    keys.insert(foldKey(token));
  }

  result.chord.keys_.assign(keys.begin(), keys.end());
  return result;
}

bool Chord::insert(char key) {
  key = foldKey(key);
  if (key < 'A' || key > 'Z' || contains(key)) {
    return false;
  }

  // First key strictly greater than the new one; append when there is none.
  std::string folded(1, key);
  auto pos = std::upper_bound(keys_.begin(), keys_.end(), folded);
  keys_.insert(pos, std::move(folded));
  return true;
}

bool Chord::contains(char key) const {
  return std::find(keys_.begin(), keys_.end(), std::string(1, foldKey(key))) != keys_.end();
}

bool Chord::lettersOnly() const {
  return std::all_of(keys_.begin(), keys_.end(), isLetterKey);
}

std::string Chord::str() const {
  std::string out;
  for (size_t i = 0; i < keys_.size(); ++i) {
    if (i > 0) out += kChordKeySeparator;
    out += keys_[i];
  }
  return out;
}

}  // namespace chordmap

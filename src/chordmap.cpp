/**
 * @file chordmap.cpp
 * @brief Implementation of the high-level chord dictionary API.
 */

#include "chordmap.h"

#include <sys/stat.h>

#include <utility>

#include "core/text_utils.h"

namespace chordmap {

namespace {

bool fileExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

}  // namespace

ChordMap::ChordMap(std::string path) : path_(std::move(path)) {}

bool ChordMap::load() {
  if (!fileExists(path_)) {
    dictionary_.clear();
    error_.clear();
    return true;
  }
  if (!dictionary_.load(path_)) {
    error_ = dictionary_.getError();
    return false;
  }
  error_.clear();
  return true;
}

bool ChordMap::save() {
  if (!dictionary_.save(path_)) {
    error_ = dictionary_.getError();
    return false;
  }
  error_.clear();
  return true;
}

bool ChordMap::rebind(const std::string& chord_text, const std::string& word,
                      std::optional<std::string>& previous) {
  Chord chord;
  if (!parseChord(chord_text, chord)) return false;

  if (chord.empty()) {
    error_ = "Empty chord";
    return false;
  }
  if (!chord.lettersOnly()) {
    error_ = "Chord " + chord.str() + " has keys other than A-Z";
    return false;
  }
  std::string stored = word;
  if (!ChordDictionary::normalizeWord(stored)) {
    error_ = trim(word).empty() ? "Empty word for chord " + chord.str()
                                : "Word for chord " + chord.str() + " spans several lines";
    return false;
  }

  previous = dictionary_.insert(chord, std::move(stored));
  return true;
}

bool ChordMap::unbind(const std::string& chord_text, std::optional<std::string>& removed) {
  Chord chord;
  if (!parseChord(chord_text, chord)) return false;

  removed = dictionary_.remove(chord);
  return true;
}

bool ChordMap::lookup(const std::string& chord_text, std::optional<std::string>& word) const {
  Chord chord;
  if (!parseChord(chord_text, chord)) return false;

  word = dictionary_.find(chord);
  return true;
}

const char* ChordMap::version() { return "1.0.0"; }

bool ChordMap::parseChord(const std::string& chord_text, Chord& chord) const {
  auto parsed = Chord::parse(chord_text);
  if (!parsed.ok()) {
    error_ = parsed.message;
    return false;
  }
  chord = parsed.chord;
  error_.clear();
  return true;
}

}  // namespace chordmap

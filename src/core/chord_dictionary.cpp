/**
 * @file chord_dictionary.cpp
 * @brief Dictionary map operations and file I/O.
 */

#include "core/chord_dictionary.h"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "core/text_utils.h"

namespace chordmap {

namespace {

// Parses one "<chord>: <word>" record. Returns false for lines to skip.
bool parseRecord(const std::string& line, Chord& chord, std::string& word) {
  size_t colon = line.find(':');
  if (colon == std::string::npos) return false;

  auto parsed = Chord::parse(line.substr(0, colon));
  if (!parsed.ok()) return false;

  word = trim(line.substr(colon + 1));
  if (word.empty()) return false;

  chord = parsed.chord;
  return true;
}

}  // namespace

bool ChordDictionary::load(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error_ = "Failed to open file: " + path;
    return false;
  }

  std::ostringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    error_ = "Failed to read file: " + path;
    return false;
  }

  loadFromString(content.str());
  return true;
}

size_t ChordDictionary::loadFromString(const std::string& text) {
  entries_.clear();
  error_.clear();

  for (const auto& line : split(text, '\n')) {
    Chord chord;
    std::string word;
    if (parseRecord(line, chord, word)) {
      entries_[chord] = std::move(word);
    }
  }
  return entries_.size();
}

bool ChordDictionary::save(const std::string& path) {
  const std::string text = toText();
  const std::string tmp_path = path + ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      error_ = "Failed to create file: " + tmp_path;
      return false;
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.flush();
    if (!file.good()) {
      file.close();
      std::remove(tmp_path.c_str());
      error_ = "Failed to write file: " + tmp_path;
      return false;
    }
  }

  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    std::remove(tmp_path.c_str());
    error_ = "Failed to replace file: " + path;
    return false;
  }

  error_.clear();
  return true;
}

std::string ChordDictionary::toText() const {
  std::string out;
  for (const auto& entry : entries_) {
    out += entry.first.str();
    out += ": ";
    out += entry.second;
    out += '\n';
  }
  return out;
}

bool ChordDictionary::normalizeWord(std::string& word) {
  word = trim(word);
  return !word.empty() && word.find('\n') == std::string::npos;
}

std::optional<std::string> ChordDictionary::insert(const Chord& chord, std::string word) {
  if (!normalizeWord(word)) return std::nullopt;

  auto it = entries_.find(chord);
  if (it == entries_.end()) {
    entries_.emplace(chord, std::move(word));
    return std::nullopt;
  }
  std::string previous = std::move(it->second);
  it->second = std::move(word);
  return previous;
}

std::optional<std::string> ChordDictionary::remove(const Chord& chord) {
  auto it = entries_.find(chord);
  if (it == entries_.end()) return std::nullopt;

  std::string removed = std::move(it->second);
  entries_.erase(it);
  return removed;
}

std::optional<std::string> ChordDictionary::find(const Chord& chord) const {
  auto it = entries_.find(chord);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

std::optional<Chord> ChordDictionary::findChordFor(const std::string& word) const {
  for (const auto& entry : entries_) {
    if (entry.second == word) return entry.first;
  }
  return std::nullopt;
}

std::vector<DictionaryEntry> ChordDictionary::entries() const {
  return std::vector<DictionaryEntry>(entries_.begin(), entries_.end());
}

}  // namespace chordmap

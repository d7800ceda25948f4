/**
 * @file word_ranking.cpp
 * @brief Word list parsing.
 */

#include "core/word_ranking.h"

#include <fstream>
#include <sstream>

#include "core/text_utils.h"

namespace chordmap {

bool WordRanking::load(const std::string& path) {
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

void WordRanking::loadFromString(const std::string& text) {
  words_.clear();
  ranks_.clear();
  error_.clear();

  for (const auto& line : split(text, '\n')) {
    std::string word = trim(line);
    if (word.empty() || word[0] == '#') continue;
    add(word);
  }
}

bool WordRanking::add(const std::string& word) {
  if (word.empty() || ranks_.count(word) > 0) return false;

  uint32_t rank = static_cast<uint32_t>(words_.size()) + 1;
  ranks_.emplace(word, rank);
  words_.push_back({rank, word});
  return true;
}

std::optional<uint32_t> WordRanking::rankOf(const std::string& word) const {
  auto it = ranks_.find(word);
  if (it == ranks_.end()) return std::nullopt;
  return it->second;
}

}  // namespace chordmap

/**
 * @file word_ranking.h
 * @brief Word frequency ranking loaded from a plain word list.
 */

#ifndef CHORDMAP_CORE_WORD_RANKING_H
#define CHORDMAP_CORE_WORD_RANKING_H

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chordmap {

/// @brief A word and its 1-based frequency rank.
struct RankedWord {
  uint32_t rank = 0;
  std::string word;
};

/**
 * @brief Words ordered by frequency, most frequent first.
 *
 * Source format: one word per line. Blank lines and lines starting with
 * '#' are skipped and do not take a rank. A repeated word keeps its first
 * rank.
 */
class WordRanking {
 public:
  /**
   * @brief Replace the ranking with the words of a file.
   * @param path Word list file
   * @return true on success, false if the file could not be read
   */
  bool load(const std::string& path);

  /// @brief Replace the ranking with the words of a text buffer.
  void loadFromString(const std::string& text);

  /// @brief Append a word with the next rank. Returns false if empty or already ranked.
  bool add(const std::string& word);

  std::optional<uint32_t> rankOf(const std::string& word) const;

  /// @brief All words in rank order.
  const std::vector<RankedWord>& entries() const { return words_; }

  size_t size() const { return words_.size(); }
  bool empty() const { return words_.empty(); }

  const std::string& getError() const { return error_; }

 private:
  std::vector<RankedWord> words_;
  std::unordered_map<std::string, uint32_t> ranks_;
  std::string error_;
};

}  // namespace chordmap

#endif  // CHORDMAP_CORE_WORD_RANKING_H

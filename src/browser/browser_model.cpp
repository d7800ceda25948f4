/**
 * @file browser_model.cpp
 * @brief Row building and key handling for the chord browser.
 */

#include "browser/browser_model.h"

#include <unordered_map>

namespace chordmap {

BrowserModel::BrowserModel(ChordDictionary& dictionary, const WordRanking* ranking)
    : dictionary_(dictionary), ranking_(ranking) {}

void BrowserModel::refresh() {
  rows_.clear();

  // Word -> first chord in ascending order
  std::unordered_map<std::string, std::string> chord_of;
  std::vector<std::string> unranked;
  for (const auto& entry : dictionary_.entries()) {
    if (chord_of.emplace(entry.second, entry.first.str()).second) {
      if (!ranking_ || !ranking_->rankOf(entry.second)) {
        unranked.push_back(entry.second);
      }
    }
  }

  auto matches = [this](const std::string& word) {
    return word.find(search_) != std::string::npos;
  };
  auto chordFor = [&chord_of](const std::string& word) {
    auto it = chord_of.find(word);
    return it == chord_of.end() ? std::string() : it->second;
  };

  if (ranking_) {
    for (const auto& ranked : ranking_->entries()) {
      if (!matches(ranked.word)) continue;
      rows_.push_back({std::to_string(ranked.rank), ranked.word, chordFor(ranked.word)});
    }
  }
  for (const auto& word : unranked) {
    if (!matches(word)) continue;
    rows_.push_back({std::string(), word, chordFor(word)});
  }

  if (rows_.empty()) {
    selected_.reset();
  } else if (selected_ && *selected_ >= rows_.size()) {
    selected_ = rows_.size() - 1;
  }
}

bool BrowserModel::handleKey(const KeyEvent& key) {
  if (!key.press) return false;
  if (key.code == KeyCode::Char && key.ctrl && key.ch == 'c') return true;

  if (mode_ == BrowserMode::Capture) {
    handleCaptureKey(key);
  } else {
    handleSearchKey(key);
  }
  return false;
}

void BrowserModel::handleSearchKey(const KeyEvent& key) {
  switch (key.code) {
    case KeyCode::Char:
      if (!key.ctrl) {
        search_ += key.ch;
        refresh();
      } else if (key.ch == 'h') {
        // Ctrl+Backspace arrives as Ctrl+H
        search_.clear();
        refresh();
      }
      break;
    case KeyCode::Backspace:
      if (!search_.empty()) {
        search_.pop_back();
        refresh();
      }
      break;
    case KeyCode::Delete:
      removeSelectedChord();
      break;
    case KeyCode::Enter:
      startCapture();
      break;
    case KeyCode::Up:
      selectPrevious();
      break;
    case KeyCode::Down:
      selectNext();
      break;
    default:
      break;
  }
}

void BrowserModel::handleCaptureKey(const KeyEvent& key) {
  switch (key.code) {
    case KeyCode::Char:
      if (key.ctrl) {
        if (key.ch == 'h') pending_.clear();
      } else if (pending_.insert(key.ch)) {
        status_.clear();
      } else {
        status_ = std::string("Key '") + key.ch + "' not added";
      }
      break;
    case KeyCode::Backspace:
      pending_.clear();
      break;
    case KeyCode::Enter:
      commitCapture();
      break;
    case KeyCode::Escape:
      cancelCapture();
      break;
    default:
      break;
  }
}

void BrowserModel::startCapture() {
  const BrowserRow* row = selectedRow();
  if (!row) return;

  mode_ = BrowserMode::Capture;
  capture_word_ = row->word;
  pending_.clear();
  status_.clear();
}

void BrowserModel::commitCapture() {
  if (pending_.empty()) {
    status_ = "No keys typed";
    return;
  }

  std::string word = capture_word_;
  if (!ChordDictionary::normalizeWord(word)) {
    status_ = "Cannot bind '" + capture_word_ + "'";
    cancelCapture();
    return;
  }

  auto previous = dictionary_.insert(pending_, word);
  if (previous) {
    status_ = "Rebound " + pending_.str() + ": " + *previous + " -> " + word;
  } else {
    status_ = "Bound " + pending_.str() + ": " + word;
  }
  modified_ = true;

  mode_ = BrowserMode::Search;
  pending_.clear();
  capture_word_.clear();
  refresh();
}

void BrowserModel::cancelCapture() {
  mode_ = BrowserMode::Search;
  pending_.clear();
  capture_word_.clear();
}

void BrowserModel::removeSelectedChord() {
  const BrowserRow* row = selectedRow();
  if (!row) return;

  auto chord = dictionary_.findChordFor(row->word);
  if (!chord) {
    status_ = "'" + row->word + "' has no chord";
    return;
  }

  // refresh() rebuilds the rows, so keep the word
  std::string word = row->word;
  dictionary_.remove(*chord);
  status_ = "Removed " + chord->str() + ": " + word;
  modified_ = true;
  refresh();
}

bool BrowserModel::takeModified() {
  bool modified = modified_;
  modified_ = false;
  return modified;
}

void BrowserModel::setSearch(const std::string& search) {
  search_ = search;
  refresh();
}

const BrowserRow* BrowserModel::selectedRow() const {
  if (!selected_ || *selected_ >= rows_.size()) return nullptr;
  return &rows_[*selected_];
}

void BrowserModel::selectPrevious() {
  if (selected_ && *selected_ > 0) {
    selected_ = *selected_ - 1;
  } else {
    selected_.reset();
  }
}

void BrowserModel::selectNext() {
  if (rows_.empty()) return;
  if (!selected_) {
    selected_ = 0;
  } else if (*selected_ + 1 < rows_.size()) {
    selected_ = *selected_ + 1;
  }
}

}  // namespace chordmap

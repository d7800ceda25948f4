/**
 * @file browser_model_test.cpp
 * @brief Tests for browser rows, search and selection.
 */

#include "browser/browser_model.h"

#include <gtest/gtest.h>

#include <cstdint>

namespace chordmap {
namespace {

class BrowserModelTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dict_.loadFromString(
        "T+H: the\n"
        "A+N+D: and\n"
        "O+F: of\n"
        "Q+Z: quiz\n");
    ranking_.loadFromString("the\nof\nto\nand\n");
  }

  static std::vector<std::string> words(const BrowserModel& model) {
    std::vector<std::string> out;
    for (const auto& row : model.rows()) out.push_back(row.word);
    return out;
  }

  ChordDictionary dict_;
  WordRanking ranking_;
};

TEST_F(BrowserModelTest, RankedWordsFirstThenUnrankedDictionaryWords) {
  BrowserModel model(dict_, &ranking_);
  model.refresh();

  ASSERT_EQ(model.rows().size(), 5u);
  EXPECT_EQ(words(model), (std::vector<std::string>{"the", "of", "to", "and", "quiz"}));

  const auto& the = model.rows()[0];
  EXPECT_EQ(the.rank, "1");
  EXPECT_EQ(the.chord, "H+T");

  const auto& to = model.rows()[2];
  EXPECT_EQ(to.rank, "3");
  EXPECT_EQ(to.chord, "");

  const auto& quiz = model.rows()[4];
  EXPECT_EQ(quiz.rank, "");
  EXPECT_EQ(quiz.chord, "Q+Z");
}

TEST_F(BrowserModelTest, WithoutRankingListsDictionaryInChordOrder) {
  BrowserModel model(dict_);
  model.refresh();
  EXPECT_EQ(words(model), (std::vector<std::string>{"and", "of", "the", "quiz"}));
  for (const auto& row : model.rows()) EXPECT_EQ(row.rank, "");
}

TEST_F(BrowserModelTest, SearchFiltersBySubstring) {
  BrowserModel model(dict_, &ranking_);
  model.setSearch("o");
  EXPECT_EQ(words(model), (std::vector<std::string>{"of", "to"}));

  model.setSearch("xyz");
  EXPECT_TRUE(model.rows().empty());
}

TEST_F(BrowserModelTest, SearchIsCaseSensitive) {
  BrowserModel model(dict_, &ranking_);
  model.setSearch("The");
  EXPECT_TRUE(model.rows().empty());
}

TEST_F(BrowserModelTest, TypingAndBackspaceEditSearch) {
  BrowserModel model(dict_, &ranking_);
  model.refresh();

  EXPECT_FALSE(model.handleKey(KeyEvent::character('t')));
  EXPECT_FALSE(model.handleKey(KeyEvent::character('h')));
  EXPECT_EQ(model.search(), "th");
  EXPECT_EQ(words(model), (std::vector<std::string>{"the"}));

  EXPECT_FALSE(model.handleKey(KeyEvent::special(KeyCode::Backspace)));
  EXPECT_EQ(model.search(), "t");
  EXPECT_EQ(words(model), (std::vector<std::string>{"the", "to"}));
}

TEST_F(BrowserModelTest, BackspaceOnEmptySearchIsHarmless) {
  BrowserModel model(dict_, &ranking_);
  model.refresh();
  EXPECT_FALSE(model.handleKey(KeyEvent::special(KeyCode::Backspace)));
  EXPECT_EQ(model.search(), "");
  EXPECT_EQ(model.rows().size(), 5u);
}

TEST_F(BrowserModelTest, CtrlHClearsSearch) {
  BrowserModel model(dict_, &ranking_);
  model.setSearch("quiz");
  EXPECT_FALSE(model.handleKey(KeyEvent::control('h')));
  EXPECT_EQ(model.search(), "");
  EXPECT_EQ(model.rows().size(), 5u);
}

TEST_F(BrowserModelTest, CtrlCQuits) {
  BrowserModel model(dict_, &ranking_);
  EXPECT_TRUE(model.handleKey(KeyEvent::control('c')));
}

TEST_F(BrowserModelTest, OtherControlKeysDoNotEditSearch) {
  BrowserModel model(dict_, &ranking_);
  model.setSearch("t");
  EXPECT_FALSE(model.handleKey(KeyEvent::control('x')));
  EXPECT_EQ(model.search(), "t");
}

TEST_F(BrowserModelTest, ReleaseEventsAreIgnored) {
  BrowserModel model(dict_, &ranking_);
  KeyEvent release = KeyEvent::character('x');
  release.press = false;
  EXPECT_FALSE(model.handleKey(release));
  EXPECT_EQ(model.search(), "");

  KeyEvent ctrl_c = KeyEvent::control('c');
  ctrl_c.press = false;
  EXPECT_FALSE(model.handleKey(ctrl_c));
}

TEST_F(BrowserModelTest, DownSelectsFirstThenAdvancesAndStopsAtEnd) {
  BrowserModel model(dict_, &ranking_);
  model.refresh();
  EXPECT_FALSE(model.selected().has_value());
  EXPECT_EQ(model.selectedRow(), nullptr);

  model.handleKey(KeyEvent::special(KeyCode::Down));
  EXPECT_EQ(model.selected(), 0u);
  ASSERT_NE(model.selectedRow(), nullptr);
  EXPECT_EQ(model.selectedRow()->word, "the");

  for (int i = 0; i < 10; ++i) model.handleKey(KeyEvent::special(KeyCode::Down));
  EXPECT_EQ(model.selected(), 4u);
  EXPECT_EQ(model.selectedRow()->word, "quiz");
}

TEST_F(BrowserModelTest, UpFromFirstRowClearsSelection) {
  BrowserModel model(dict_, &ranking_);
  model.refresh();
  model.selectNext();
  model.selectNext();
  EXPECT_EQ(model.selected(), 1u);

  model.handleKey(KeyEvent::special(KeyCode::Up));
  EXPECT_EQ(model.selected(), 0u);
  model.handleKey(KeyEvent::special(KeyCode::Up));
  EXPECT_FALSE(model.selected().has_value());
  model.handleKey(KeyEvent::special(KeyCode::Up));
  EXPECT_FALSE(model.selected().has_value());
}

TEST_F(BrowserModelTest, DownOnEmptyRowsSelectsNothing) {
  BrowserModel model(dict_, &ranking_);
  model.setSearch("nothing matches");
  model.selectNext();
  EXPECT_FALSE(model.selected().has_value());
}

TEST_F(BrowserModelTest, SelectionClampedWhenRowsShrink) {
  BrowserModel model(dict_, &ranking_);
  model.refresh();
  for (int i = 0; i < 4; ++i) model.selectNext();
  EXPECT_EQ(model.selected(), 3u);

  model.setSearch("o");  // two rows
  EXPECT_EQ(model.selected(), 1u);

  model.setSearch("zzz");
  EXPECT_FALSE(model.selected().has_value());
}

TEST_F(BrowserModelTest, RefreshSeesDictionaryChanges) {
  BrowserModel model(dict_, &ranking_);
  model.refresh();
  dict_.insert(Chord::parse("t+o").chord, "to");
  dict_.remove(Chord::parse("q+z").chord);
  model.refresh();

  EXPECT_EQ(words(model), (std::vector<std::string>{"the", "of", "to", "and"}));
  EXPECT_EQ(model.rows()[2].chord, "O+T");
}

TEST_F(BrowserModelTest, WordBoundToSeveralChordsShowsFirstChord) {
  dict_.insert(Chord::parse("e+h+t").chord, "the");
  BrowserModel model(dict_, &ranking_);
  model.setSearch("the");
  ASSERT_EQ(model.rows().size(), 1u);
  EXPECT_EQ(model.rows()[0].chord, "E+H+T");
}

// ============================================================================
// Chord capture and removal
// ============================================================================

class BrowserEditTest : public BrowserModelTest {
 protected:
  // Rows: the, of, to, and, quiz
  void selectWord(BrowserModel& model, const std::string& word) {
    model.refresh();
    while (!model.selectedRow() || model.selectedRow()->word != word) {
      size_t before = model.selected().value_or(SIZE_MAX);
      model.selectNext();
      ASSERT_NE(model.selected().value_or(SIZE_MAX), before) << word << " not listed";
    }
  }

  void type(BrowserModel& model, const std::string& keys) {
    for (char c : keys) model.handleKey(KeyEvent::character(c));
  }

  static KeyEvent enter() { return KeyEvent::special(KeyCode::Enter); }
};

TEST_F(BrowserEditTest, EnterWithoutSelectionDoesNothing) {
  BrowserModel model(dict_, &ranking_);
  model.refresh();
  EXPECT_FALSE(model.handleKey(enter()));
  EXPECT_EQ(model.mode(), BrowserMode::Search);
}

TEST_F(BrowserEditTest, EnterStartsCaptureForSelectedWord) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "to");
  model.handleKey(enter());

  EXPECT_EQ(model.mode(), BrowserMode::Capture);
  EXPECT_EQ(model.captureWord(), "to");
  EXPECT_TRUE(model.pendingChord().empty());
}

TEST_F(BrowserEditTest, TypedKeysBuildPendingChordNotSearch) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "to");
  model.handleKey(enter());

  type(model, "ot");
  EXPECT_EQ(model.pendingChord().str(), "O+T");
  EXPECT_EQ(model.search(), "");
  EXPECT_TRUE(model.status().empty());

  type(model, "T");
  EXPECT_EQ(model.pendingChord().str(), "O+T");
  EXPECT_EQ(model.status(), "Key 'T' not added");

  type(model, "1");
  EXPECT_EQ(model.pendingChord().str(), "O+T");
  EXPECT_EQ(model.status(), "Key '1' not added");
}

TEST_F(BrowserEditTest, EnterBindsPendingChord) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "to");
  model.handleKey(enter());
  type(model, "ot");
  model.handleKey(enter());

  EXPECT_EQ(model.mode(), BrowserMode::Search);
  EXPECT_EQ(dict_.find(Chord::parse("o+t").chord), "to");
  EXPECT_EQ(model.status(), "Bound O+T: to");
  EXPECT_TRUE(model.takeModified());
  EXPECT_FALSE(model.takeModified());

  ASSERT_NE(model.selectedRow(), nullptr);
  EXPECT_EQ(model.selectedRow()->word, "to");
  EXPECT_EQ(model.selectedRow()->chord, "O+T");
}

TEST_F(BrowserEditTest, BindingTakenChordReportsPreviousWord) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "and");
  model.handleKey(enter());
  type(model, "th");
  model.handleKey(enter());

  EXPECT_EQ(model.status(), "Rebound H+T: the -> and");
  EXPECT_EQ(dict_.find(Chord::parse("h+t").chord), "and");
  EXPECT_EQ(model.rows()[0].word, "the");
  EXPECT_EQ(model.rows()[0].chord, "");
}

TEST_F(BrowserEditTest, EnterWithoutKeysKeepsCapturing) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "to");
  model.handleKey(enter());
  model.handleKey(enter());

  EXPECT_EQ(model.mode(), BrowserMode::Capture);
  EXPECT_EQ(model.status(), "No keys typed");
  EXPECT_FALSE(model.takeModified());
}

TEST_F(BrowserEditTest, BackspaceClearsPendingChord) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "to");
  model.handleKey(enter());
  type(model, "ot");
  model.handleKey(KeyEvent::special(KeyCode::Backspace));
  EXPECT_TRUE(model.pendingChord().empty());
  EXPECT_EQ(model.mode(), BrowserMode::Capture);
}

TEST_F(BrowserEditTest, EscapeCancelsCapture) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "to");
  model.handleKey(enter());
  type(model, "ot");
  model.handleKey(KeyEvent::special(KeyCode::Escape));

  EXPECT_EQ(model.mode(), BrowserMode::Search);
  EXPECT_TRUE(model.pendingChord().empty());
  EXPECT_FALSE(dict_.find(Chord::parse("o+t").chord).has_value());
  EXPECT_FALSE(model.takeModified());
}

TEST_F(BrowserEditTest, CtrlCQuitsWhileCapturing) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "to");
  model.handleKey(enter());
  EXPECT_TRUE(model.handleKey(KeyEvent::control('c')));
}

TEST_F(BrowserEditTest, DeleteRemovesChordOfSelectedRow) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "the");
  model.handleKey(KeyEvent::special(KeyCode::Delete));

  EXPECT_FALSE(dict_.find(Chord::parse("t+h").chord).has_value());
  EXPECT_EQ(model.status(), "Removed H+T: the");
  EXPECT_TRUE(model.takeModified());
  ASSERT_NE(model.selectedRow(), nullptr);
  EXPECT_EQ(model.selectedRow()->word, "the");
  EXPECT_EQ(model.selectedRow()->chord, "");
}

TEST_F(BrowserEditTest, DeleteOnWordWithoutChord) {
  BrowserModel model(dict_, &ranking_);
  selectWord(model, "to");
  model.handleKey(KeyEvent::special(KeyCode::Delete));

  EXPECT_EQ(model.status(), "'to' has no chord");
  EXPECT_FALSE(model.takeModified());
  EXPECT_EQ(dict_.size(), 4u);
}

}  // namespace
}  // namespace chordmap

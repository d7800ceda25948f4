/**
 * @file cli_main.cpp
 * @brief Command-line interface for editing and browsing a chord dictionary.
 */

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "browser/browser_model.h"
#include "browser/browser_view.h"
#include "browser/terminal.h"
#include "chordmap.h"
#include "core/json_helpers.h"
#include "core/word_ranking.h"

namespace {

struct CliOptions {
  std::string dict_file = "chords.txt";
  std::string words_file;  // Optional ranking
  std::string search;
  bool json_output = false;
  std::string command;
  std::vector<std::string> args;
};

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " [options] <command> [args]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  list               List words with rank and chord\n";
  std::cout << "  lookup CHORD       Show the word bound to CHORD\n";
  std::cout << "  add CHORD WORD...  Bind CHORD to WORD (replaces an existing binding)\n";
  std::cout << "  remove CHORD       Remove the binding of CHORD\n";
  std::cout << "  normalize          Rewrite the dictionary file in canonical form\n";
  std::cout << "  browse             Interactive search and editing:\n";
  std::cout << "                       Up/Down select, Enter then keys then Enter binds a chord,\n";
  std::cout << "                       Esc cancels, Delete unbinds, Ctrl+C quits\n\n";
  std::cout << "Options:\n";
  std::cout << "  --dict FILE        Dictionary file (default: chords.txt)\n";
  std::cout << "  --words FILE       Word list, most frequent first, for the rank column\n";
  std::cout << "  --search TEXT      Only list words containing TEXT\n";
  std::cout << "  --json             Output JSON to stdout (with list)\n";
  std::cout << "  --help             Show this help message\n\n";
  std::cout << "Chords are written as keys joined by '+', e.g. a+k or K+A.\n";
}

std::string joinArgs(const std::vector<std::string>& args, size_t from) {
  std::string out;
  for (size_t i = from; i < args.size(); ++i) {
    if (i > from) out += ' ';
    out += args[i];
  }
  return out;
}

bool loadRanking(const CliOptions& opts, chordmap::WordRanking& ranking) {
  if (opts.words_file.empty()) return true;
  if (!ranking.load(opts.words_file)) {
    std::cerr << "Error: " << ranking.getError() << "\n";
    return false;
  }
  return true;
}

bool saveMap(chordmap::ChordMap& map) {
  if (!map.save()) {
    std::cerr << "Error: " << map.getError() << "\n";
    return false;
  }
  std::cout << "Saved: " << map.path() << " (" << map.dictionary().size() << " chords)\n";
  return true;
}

void printRowsJson(const std::vector<chordmap::BrowserRow>& rows) {
  chordmap::json::Writer w(std::cout);
  w.beginObject().beginArray("entries");
  for (const auto& row : rows) {
    w.beginObject();
    if (row.rank.empty()) {
      w.writeNull("rank");
    } else {
      w.write("rank", std::strtoul(row.rank.c_str(), nullptr, 10));
    }
    w.write("word", row.word).write("chord", row.chord).endObject();
  }
  w.endArray().endObject();
  std::cout << "\n";
}

void printRowsText(const std::vector<chordmap::BrowserRow>& rows) {
  size_t rank_width = 4;
  size_t word_width = 4;
  for (const auto& row : rows) {
    rank_width = std::max(rank_width, row.rank.size());
    word_width = std::max(word_width, row.word.size());
  }

  std::cout << std::left << std::setw(static_cast<int>(rank_width)) << "Rank" << "  "
            << std::setw(static_cast<int>(word_width)) << "Word" << "  Chord\n";
  for (const auto& row : rows) {
    std::cout << std::setw(static_cast<int>(rank_width)) << row.rank << "  "
              << std::setw(static_cast<int>(word_width)) << row.word << "  " << row.chord << "\n";
  }
  std::cout << std::right;
}

int runList(const CliOptions& opts, chordmap::ChordMap& map) {
  chordmap::WordRanking ranking;
  if (!loadRanking(opts, ranking)) return 1;

  chordmap::BrowserModel model(map.dictionary(), opts.words_file.empty() ? nullptr : &ranking);
  model.setSearch(opts.search);

  if (opts.json_output) {
    printRowsJson(model.rows());
  } else {
    printRowsText(model.rows());
  }
  return 0;
}

int runBrowse(const CliOptions& opts, chordmap::ChordMap& map) {
  chordmap::WordRanking ranking;
  if (!loadRanking(opts, ranking)) return 1;

  chordmap::BrowserModel model(map.dictionary(), opts.words_file.empty() ? nullptr : &ranking);
  model.setSearch(opts.search);

  chordmap::TerminalSession terminal;
  if (!terminal.open()) {
    std::cerr << "Error: " << terminal.getError() << "\n";
    return 1;
  }

  std::string save_error;
  bool quit = false;
  while (!quit) {
    size_t width = 0;
    size_t height = 0;
    terminal.size(width, height);
    if (!terminal.write(chordmap::renderFrame(chordmap::layoutBrowser(model, width, height)))) {
      break;
    }

    std::string input = terminal.read();
    if (input.empty()) break;
    for (const auto& key : chordmap::decodeKeys(input)) {
      if (model.handleKey(key)) {
        quit = true;
        break;
      }
    }

    if (model.takeModified() && !map.save()) {
      save_error = map.getError();
      quit = true;
    }
  }

  terminal.close();
  if (!save_error.empty()) {
    std::cerr << "Error: " << save_error << "\n";
    return 1;
  }
  if (!terminal.getError().empty()) {
    std::cerr << "Error: " << terminal.getError() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--dict") == 0 && i + 1 < argc) {
      opts.dict_file = argv[++i];
    } else if (std::strcmp(argv[i], "--words") == 0 && i + 1 < argc) {
      opts.words_file = argv[++i];
    } else if (std::strcmp(argv[i], "--search") == 0 && i + 1 < argc) {
      opts.search = argv[++i];
    } else if (std::strcmp(argv[i], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (std::strncmp(argv[i], "--", 2) == 0) {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      return 1;
    } else if (opts.command.empty()) {
      opts.command = argv[i];
    } else {
      opts.args.push_back(argv[i]);
    }
  }

  if (opts.command.empty()) {
    printUsage(argv[0]);
    return 1;
  }

  chordmap::ChordMap map(opts.dict_file);
  if (!map.load()) {
    std::cerr << "Error: " << map.getError() << "\n";
    return 1;
  }

  if (opts.command == "list") {
    return runList(opts, map);
  }

  if (opts.command == "browse") {
    return runBrowse(opts, map);
  }

  if (opts.command == "lookup") {
    if (opts.args.size() != 1) {
      std::cerr << "Usage: lookup CHORD\n";
      return 1;
    }
    std::optional<std::string> word;
    if (!map.lookup(opts.args[0], word)) {
      std::cerr << "Error: " << map.getError() << "\n";
      return 1;
    }
    if (!word) {
      std::cout << opts.args[0] << ": (unbound)\n";
      return 1;
    }
    std::cout << *word << "\n";
    return 0;
  }

  if (opts.command == "add") {
    if (opts.args.size() < 2) {
      std::cerr << "Usage: add CHORD WORD...\n";
      return 1;
    }
    std::optional<std::string> previous;
    std::optional<std::string> stored;
    if (!map.rebind(opts.args[0], joinArgs(opts.args, 1), previous) ||
        !map.lookup(opts.args[0], stored) || !stored) {
      std::cerr << "Error: " << map.getError() << "\n";
      return 1;
    }
    if (previous) {
      std::cout << "Rebound " << opts.args[0] << ": " << *previous << " -> " << *stored << "\n";
    } else {
      std::cout << "Bound " << opts.args[0] << ": " << *stored << "\n";
    }
    return saveMap(map) ? 0 : 1;
  }

  if (opts.command == "remove") {
    if (opts.args.size() != 1) {
      std::cerr << "Usage: remove CHORD\n";
      return 1;
    }
    std::optional<std::string> removed;
    if (!map.unbind(opts.args[0], removed)) {
      std::cerr << "Error: " << map.getError() << "\n";
      return 1;
    }
    if (!removed) {
      std::cout << opts.args[0] << " was not bound\n";
      return 0;
    }
    std::cout << "Removed " << opts.args[0] << ": " << *removed << "\n";
    return saveMap(map) ? 0 : 1;
  }

  if (opts.command == "normalize") {
    std::cout << "Loaded " << map.dictionary().size() << " chords from " << map.path() << "\n";
    return saveMap(map) ? 0 : 1;
  }

  std::cerr << "Unknown command: " << opts.command << " (see --help)\n";
  return 1;
}

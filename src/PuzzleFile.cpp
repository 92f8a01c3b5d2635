#include "PuzzleFile.hpp"

#include <fstream>
#include <sstream>

static inline bool isSudokuChar(char c) {
  return (c == '.') || (c >= '0' && c <= '9');
}

static std::string trim(const std::string &s) {
  size_t a = 0;
  while (a < s.size() && (s[a] == ' ' || s[a] == '\t' || s[a] == '\r' || s[a] == '\n')) {
    a++;
  }
  size_t b = s.size();
  while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) {
    b--;
  }
  return s.substr(a, b - a);
}

bool parsePuzzleLine(const std::string &line, size_t lineNo, Puzzle *out) {
  std::string s = trim(line);

  // Allow comments and blank lines
  if (s.empty() || s[0] == '#') {
    return false;
  }

  std::string name;
  const size_t colon = s.find(':');
  if (colon != std::string::npos) {
    name = trim(s.substr(0, colon));
    s = s.substr(colon + 1);
  }
  if (name.empty()) {
    name = "line" + std::to_string(lineNo);
  }

  // Remove spaces in-between if the file uses spaced formatting.
  std::string compact;
  compact.reserve(s.size());
  for (char c : s) {
    if (c == ' ' || c == '\t' || c == '\r') {
      continue;
    }
    if (!isSudokuChar(c)) {
      std::ostringstream oss;
      oss << "line " << lineNo << ": invalid character '" << c << "' (allowed: 0-9 or .)";
      throw PuzzleFormatError(oss.str());
    }
    compact.push_back(c);
  }

  if (compact.size() != 81) {
    std::ostringstream oss;
    oss << "line " << lineNo << ": expected 81 chars, got " << compact.size();
    throw PuzzleFormatError(oss.str());
  }

  Puzzle puzzle;
  puzzle.setName(name);
  if (!puzzle.importFromString(compact.c_str())) {
    throw PuzzleFormatError("line " + std::to_string(lineNo) + ": incomplete grid");
  }
  *out = puzzle;
  return true;
}

std::vector<Puzzle> loadPuzzles(const std::string &path) {
  std::ifstream fin(path);
  if (!fin) {
    throw PuzzleFormatError("failed to open file: " + path);
  }

  std::vector<Puzzle> puzzles;
  std::string line;
  size_t lineNo = 0;
  while (std::getline(fin, line)) {
    lineNo++;
    Puzzle puzzle;
    if (parsePuzzleLine(line, lineNo, &puzzle)) {
      puzzles.push_back(puzzle);
    }
  }
  return puzzles;
}

#ifndef PUZZLE_FILE_H
#define PUZZLE_FILE_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "Puzzle.hpp"

class PuzzleFormatError : public std::runtime_error
{
public:
  explicit PuzzleFormatError(const std::string &what) : std::runtime_error(what) { }
};

// "name: <81 symbols>" or "<81 symbols>" (named line<N>).
// Returns false for blank and '#' comment lines; throws PuzzleFormatError on a malformed record.
bool parsePuzzleLine(const std::string &line, size_t lineNo, Puzzle *out);

// every record of the file, in file order
std::vector<Puzzle> loadPuzzles(const std::string &path);

#endif // PUZZLE_FILE_H

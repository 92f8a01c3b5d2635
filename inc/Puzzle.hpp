#ifndef PUZZLE_H
#define PUZZLE_H

#include <string>
#include "utils.hpp"

// A named 9x9 puzzle as given: 0 = unknown, 1..9 = digit.
class Puzzle
{
public:
  Puzzle();

  Puzzle(const std::string &name, const char *in81);

  // digits 1..9 are values; 0 or '.' are empty; other characters are skipped.
  // Returns 0 if fewer than 81 symbols were recognised, else 1.
  int importFromString(const char *in81);

  const std::string &getName() const;

  void setName(const std::string &name);

  Digit getValue(Index idx) const;

private:
  std::string name;
  Digit values[81];
};

#endif // PUZZLE_H

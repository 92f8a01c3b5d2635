#include "Puzzle.hpp"

#include <stdexcept>

// =========================================================
// Puzzle
// =========================================================

// empty puzzle
Puzzle::Puzzle() : values() { }

Puzzle::Puzzle(const std::string &name, const char *in81) : name(name), values() {
  if (!importFromString(in81)) {
    throw std::invalid_argument("Puzzle '" + name + "': expected 81 symbols (0-9 or .)");
  }
}

int Puzzle::importFromString(const char *in81) {
  int tokens = 0;
  for (int i = 0; in81[i] != '\0'; i++) {
    const char ch = in81[i];
    if (ch >= '1' && ch <= '9') {
      // given
      values[tokens] = (Digit)(ch - '0');
    } else if (ch == '0' || ch == '.') {
      // empty
      values[tokens] = 0;
    } else {
      // skip character
      continue;
    }

    if (++tokens == 81) {
      break;
    }
  }

  // incomplete sudoku if fewer than 81 recognised symbols
  if (tokens < 81) {
    return 0;
  }
  return 1;
}

const std::string &Puzzle::getName() const {
  return name;
}

void Puzzle::setName(const std::string &name) {
  this->name = name;
}

Digit Puzzle::getValue(Index idx) const {
  return values[idx];
}

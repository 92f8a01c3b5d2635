#include "SudokuRow.hpp"

// =========================================================
// SudokuRow
// =========================================================

SudokuRow::SudokuRow() : contradicted(false) { }

SudokuRow SudokuRow::contradiction() {
  SudokuRow row;
  row.contradicted = true;
  return row;
}

bool SudokuRow::isContradiction() const {
  return contradicted;
}

const SudokuCell &SudokuRow::at(int k) const {
  return cells[k];
}

void SudokuRow::set(int k, const SudokuCell &cell) {
  cells[k] = cell;
}

bool SudokuRow::operator==(const SudokuRow &other) const {
  if (contradicted || other.contradicted) {
    return contradicted == other.contradicted;
  }
  for (int k = 0; k < 9; k++) {
    if (cells[k] != other.cells[k]) {
      return false;
    }
  }
  return true;
}

bool SudokuRow::operator!=(const SudokuRow &other) const {
  return !(*this == other);
}

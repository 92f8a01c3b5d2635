#include "SudokuCell.hpp"
#include "utils.hpp"

// =========================================================
// SudokuCell
// =========================================================

SudokuCell::SudokuCell() : kind(CellKind::Candidates), value(0), candMask(ALL_DIGITS) { }

SudokuCell::SudokuCell(CellKind kind, Digit value, Mask mask) : kind(kind), value(value), candMask(mask) { }

SudokuCell SudokuCell::fixed(Digit digit) {
  return SudokuCell(CellKind::Fixed, digit, digitToBit(digit));
}

SudokuCell SudokuCell::candidates(Mask mask) {
  mask = (Mask)(mask & ALL_DIGITS);
  if (mask == 0) {
    return contradiction();
  }
  return SudokuCell(CellKind::Candidates, 0, mask);
}

SudokuCell SudokuCell::contradiction() {
  return SudokuCell(CellKind::Contradiction, 0, 0);
}

// --- value ---
Digit SudokuCell::getValue() const {
  return value;
}

bool SudokuCell::isFixed() const {
  return kind == CellKind::Fixed;
}

bool SudokuCell::isContradiction() const {
  return kind == CellKind::Contradiction;
}

bool SudokuCell::isDecided() const {
  return kind != CellKind::Candidates;
}

// --- candidates ---
Mask SudokuCell::getCandidateMask() const {
  return (Mask)(candMask & ALL_DIGITS);
}

bool SudokuCell::hasCandidate(Digit digit) const {
  return (getCandidateMask() & digitToBit(digit)) != 0;
}

size_t SudokuCell::countCandidates() const {
  return countBits9(getCandidateMask());
}

Digit SudokuCell::getSingleCandidate() const {
  const Mask m = getCandidateMask();
  if (countBits9(m) == 1) {
    return bitToDigitSingle(m);
  }
  return 0;
}

bool SudokuCell::operator==(const SudokuCell &other) const {
  return kind == other.kind && value == other.value && getCandidateMask() == other.getCandidateMask();
}

bool SudokuCell::operator!=(const SudokuCell &other) const {
  return !(*this == other);
}

// Fixed cells first (by digit), then candidate sets compared as ascending digit lists
bool SudokuCell::operator<(const SudokuCell &other) const {
  if (kind != other.kind) {
    // Fixed < Candidates < Contradiction
    const int rank = (kind == CellKind::Fixed) ? 0 : (kind == CellKind::Candidates ? 1 : 2);
    const int otherRank = (other.kind == CellKind::Fixed) ? 0 : (other.kind == CellKind::Candidates ? 1 : 2);
    return rank < otherRank;
  }
  if (kind == CellKind::Fixed) {
    return value < other.value;
  }

  Mask a = getCandidateMask();
  Mask b = other.getCandidateMask();
  while (a != 0 && b != 0) {
    const Digit da = bitToDigitSingle((Mask)(a & (Mask)(-(int)a)));
    const Digit db = bitToDigitSingle((Mask)(b & (Mask)(-(int)b)));
    if (da != db) {
      return da < db;
    }
    a = (Mask)(a & (a - 1u));
    b = (Mask)(b & (b - 1u));
  }
  // shorter list (proper prefix) sorts first
  return a == 0 && b != 0;
}

#ifndef SUDOKU_CELL_H
#define SUDOKU_CELL_H

#include <cstddef>
#include <cstdint>
#include "utils.hpp"

enum class CellKind : uint8_t {
  Candidates = 0,
  Fixed = 1,
  Contradiction = 2
};

class SudokuCell
{
public:
  // all nine candidates
  SudokuCell();

  static SudokuCell fixed(Digit digit);

  // an empty mask yields a contradiction
  static SudokuCell candidates(Mask mask);

  static SudokuCell contradiction();

  // --- value ---
  Digit getValue() const;

  bool isFixed() const;

  bool isContradiction() const;

  // fixed or contradiction
  bool isDecided() const;

  // --- candidates ---
  Mask getCandidateMask() const;

  bool hasCandidate(Digit digit) const;

  size_t countCandidates() const;

  Digit getSingleCandidate() const;

  bool operator==(const SudokuCell &other) const;
  bool operator!=(const SudokuCell &other) const;
  bool operator<(const SudokuCell &other) const;

private:
  SudokuCell(CellKind kind, Digit value, Mask mask);

  CellKind kind;
  Digit    value;     // 1..9 when fixed, else 0
  Mask     candMask;  // 9-bit
};

#endif // SUDOKU_CELL_H

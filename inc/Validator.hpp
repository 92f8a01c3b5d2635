#ifndef VALIDATOR_H
#define VALIDATOR_H

#include <stdexcept>
#include "SudokuGrid.hpp"

// Raised when a grid the search reported as solved breaks a Sudoku rule.
// The engine is broken at that point; callers are not expected to recover.
class InvalidSolutionFault : public std::logic_error
{
public:
  explicit InvalidSolutionFault(const SudokuGrid &grid);

  const SudokuGrid &getGrid() const;

private:
  SudokuGrid grid;
};

// a contradiction is vacuously valid; otherwise every row, column and block holds 1..9 exactly once
bool validSolution(const SudokuGrid &solution);

// returns the solution unchanged, or logs and throws InvalidSolutionFault
const SudokuGrid &checkedSolution(const SudokuGrid &solution);

#endif // VALIDATOR_H

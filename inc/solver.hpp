#ifndef SOLVER_H
#define SOLVER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "Puzzle.hpp"
#include "SudokuGrid.hpp"

struct PuzzleSolution {
  std::string name;
  SudokuGrid solution;  // contradiction = no solution
};

struct BatchResult {
  std::vector<PuzzleSolution> solutions;  // input order
  size_t launched;
  size_t completions;
};

typedef SudokuGrid (*SolveFn)(const Puzzle &);

// Throw InvalidSolutionFault if the engine produces a broken grid.
SudokuGrid solve(const Puzzle &puzzle);

SudokuGrid solveParallel(const Puzzle &puzzle);

// One task per puzzle, each running solve(); returns once every task has reported.
// A fault in any task is rethrown after all of them finished.
BatchResult solveAll(const std::vector<Puzzle> &puzzles);

// same barrier, each task running fn instead of solve()
BatchResult solveAll(const std::vector<Puzzle> &puzzles, SolveFn fn);

extern "C"
{
  int sudopar_solver_full(const char *in81, char *out81);

  int sudopar_solver_parallel(const char *in81, char *out81);
} // extern "C"

#endif // SOLVER_H

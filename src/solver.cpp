// sudopar Solver Core (C++)
// Constraint propagation over rows, columns and blocks, plus depth-first search
// on the most constrained cell. Propagation can fan each pass out to one task
// per row; a batch of puzzles can fan out to one task per puzzle.
//
// Exported functions:
//   int sudopar_solver_full(const char *in81, char *out81);
//   int sudopar_solver_parallel(const char *in81, char *out81);
//
// Caller -> solver contract:
//   in81[81]   : char      (0 or . = empty, 1..9 = digit, other characters skipped)
//
// Output string (out81[82] as char, NUL terminated):
//   out81[81]  : char      (1..9 = digit, all '.' = no solution)
//
// Notes:
//   - No state survives between calls.
//   - An engine fault (a solved grid that breaks a rule) is not mapped to a
//     return code: InvalidSolutionFault propagates to the caller.

#include <cstdint>
#include <cstddef>
#include <exception>
#include <vector>

#include "solver.hpp"
#include "ConstraintEngine.hpp"
#include "SearchEngine.hpp"
#include "TaskGroup.hpp"
#include "Validator.hpp"
#include "log.hpp"

// =========================================================
// C++ API
// =========================================================

SudokuGrid solve(const Puzzle &puzzle) {
  return checkedSolution(solveRefined(refine(fill(puzzle))));
}

SudokuGrid solveParallel(const Puzzle &puzzle) {
  return checkedSolution(solveRefined(refineParallel(fill(puzzle))));
}

BatchResult solveAll(const std::vector<Puzzle> &puzzles) {
  return solveAll(puzzles, &solve);
}

BatchResult solveAll(const std::vector<Puzzle> &puzzles, SolveFn fn) {
  TaskGroup<SudokuGrid> group(puzzles.size());
  for (const Puzzle &puzzle : puzzles) {
    group.launch([puzzle, fn]() { return fn(puzzle); });
  }

  std::vector<SudokuGrid> outcomes;
  try {
    outcomes = group.join();
  } catch (const std::exception &e) {
    SUDOPAR_LOG("solveAll: batch of %lu aborted: %s", (unsigned long)group.launched(), e.what());
    throw;
  }

  BatchResult result;
  result.launched = group.launched();
  result.completions = group.completions();
  result.solutions.reserve(puzzles.size());
  for (size_t i = 0; i < puzzles.size(); i++) {
    PuzzleSolution entry;
    entry.name = puzzles[i].getName();
    entry.solution = outcomes[i];
    result.solutions.push_back(entry);
  }
  return result;
}

// =========================================================
// Public API with C linkage
// =========================================================

// shared by all interface functions
static int solve_to_string(SolveFn fn, const char *in81, char *out81) {
  if (in81 == nullptr || out81 == nullptr) {
    return 0;
  }

  Puzzle puzzle;
  if (!puzzle.importFromString(in81)) {
    return 0;
  }

  const SudokuGrid solution = fn(puzzle);
  solution.exportToString(out81);

  return solution.isContradiction() ? 0 : 1;
}

extern "C"
{
  // Solves an entire Sudoku given its initial representation in one shot.
  // Returns 0 in case of error or if there is no solution, else 1.
  EMSCRIPTEN_KEEPALIVE
  int sudopar_solver_full(const char *in81, char *out81) {
    return solve_to_string(&solve, in81, out81);
  }

  // Same as sudopar_solver_full, with row-parallel propagation.
  EMSCRIPTEN_KEEPALIVE
  int sudopar_solver_parallel(const char *in81, char *out81) {
    return solve_to_string(&solveParallel, in81, out81);
  }
} // extern "C"

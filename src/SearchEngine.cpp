#include "SearchEngine.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include "ConstraintEngine.hpp"
#include "log.hpp"
#include "utils.hpp"

bool solved(const SudokuGrid &grid) {
  return grid.isCompletelyDecided();
}

int hardness(const SudokuGrid &grid) {
  if (grid.isContradiction()) {
    return 0;
  }
  int total = 0;
  for (Index idx = 0; idx < 81; idx++) {
    const SudokuCell &cell = grid.getCell(idx);
    if (!cell.isDecided()) {
      total += (int)cell.countCandidates();
    }
  }
  return total;
}

Guess guess(const SudokuGrid &grid) {
  // row-major scan with a strict comparison keeps the smallest (row, col) on ties
  Guess best = { 0, 0, 0 };
  size_t bestCount = 10;
  if (!grid.isContradiction()) {
    for (Index idx = 0; idx < 81; idx++) {
      const SudokuCell &cell = grid.getCell(idx);
      if (cell.isDecided()) {
        continue;
      }
      const size_t count = cell.countCandidates();
      if (count < bestCount) {
        bestCount = count;
        best.row = idxRow(idx) + 1;
        best.col = idxCol(idx) + 1;
        best.candidates = cell.getCandidateMask();
      }
    }
  }
  if (best.row == 0) {
    throw std::logic_error("guess() on a grid without undecided cells");
  }
  return best;
}

std::vector<SudokuGrid> guesses(const SudokuGrid &grid) {
  const Guess g = guess(grid);
  SUDOPAR_DEBUG("guess: r%dc%d, %d candidate(s)", g.row, g.col, (int)countBits9(g.candidates));

  const SudokuCell branched = grid.valueAt(g.row, g.col);
  std::vector<std::pair<int, SudokuGrid> > children;
  for (Digit d = 1; d <= 9; d++) {
    if (!branched.hasCandidate(d)) {
      continue;
    }
    const SudokuGrid child = refine(grid.replaceCell(g.row, g.col, SudokuCell::fixed(d)));
    if (child.isContradiction()) {
      continue;
    }
    children.push_back(std::make_pair(hardness(child), child));
  }

  // easiest first; equal hardness falls back to grid order
  std::sort(children.begin(), children.end());

  std::vector<SudokuGrid> sorted;
  sorted.reserve(children.size());
  for (const std::pair<int, SudokuGrid> &child : children) {
    sorted.push_back(child.second);
  }
  return sorted;
}

SudokuGrid solveRefined(const SudokuGrid &grid) {
  if (solved(grid)) {
    return grid;
  }
  return solveOne(guesses(grid));
}

SudokuGrid solveOne(const std::vector<SudokuGrid> &branches) {
  for (const SudokuGrid &branch : branches) {
    const SudokuGrid solution = solveRefined(branch);
    if (!solution.isContradiction()) {
      return solution;
    }
  }
  return SudokuGrid::contradiction();
}

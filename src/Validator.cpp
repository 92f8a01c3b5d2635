#include "Validator.hpp"

#include <string>
#include "log.hpp"
#include "utils.hpp"

static std::string describe(const SudokuGrid &grid) {
  char out81[82];
  grid.exportToString(out81);
  return std::string("invalid solution: ") + out81;
}

InvalidSolutionFault::InvalidSolutionFault(const SudokuGrid &grid) : std::logic_error(describe(grid)), grid(grid) { }

const SudokuGrid &InvalidSolutionFault::getGrid() const {
  return grid;
}

// every unit (row of this view) must be a permutation of 1..9
static bool validRows(const SudokuGrid &view) {
  for (int r = 0; r < 9; r++) {
    const SudokuRow row = view.getRow(r);
    Mask seen = 0;
    for (int k = 0; k < 9; k++) {
      const SudokuCell &cell = row.at(k);
      if (!cell.isFixed()) {
        return false;
      }
      const Mask bit = digitToBit(cell.getValue());
      if ((seen & bit) != 0) {
        return false;
      }
      seen = (Mask)(seen | bit);
    }
    if (seen != ALL_DIGITS) {
      return false;
    }
  }
  return true;
}

bool validSolution(const SudokuGrid &solution) {
  if (solution.isContradiction()) {
    return true;
  }
  return validRows(solution) && validRows(solution.transpose()) && validRows(solution.toBlockView());
}

const SudokuGrid &checkedSolution(const SudokuGrid &solution) {
  if (!validSolution(solution)) {
    const InvalidSolutionFault fault(solution);
    SUDOPAR_LOG("%s", fault.what());
    throw fault;
  }
  return solution;
}

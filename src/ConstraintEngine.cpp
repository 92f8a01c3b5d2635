#include "ConstraintEngine.hpp"

#include <vector>
#include "TaskGroup.hpp"
#include "log.hpp"
#include "utils.hpp"

// =========================================================
// Fill
// =========================================================

SudokuGrid fill(const Puzzle &puzzle) {
  SudokuGrid grid;
  for (Index idx = 0; idx < 81; idx++) {
    const Digit d = puzzle.getValue(idx);
    if (d >= 1 && d <= 9) {
      grid.setCell(idx, SudokuCell::fixed(d));
    } else {
      grid.setCell(idx, SudokuCell::candidates(ALL_DIGITS));
    }
  }
  return grid;
}

// =========================================================
// Row elimination
// =========================================================

SudokuRow refineRow(const SudokuRow &row) {
  if (row.isContradiction()) {
    return row;
  }

  // digits already placed in this row
  Mask entries = 0;
  for (int k = 0; k < 9; k++) {
    const SudokuCell &cell = row.at(k);
    if (cell.isContradiction()) {
      return SudokuRow::contradiction();
    }
    if (cell.isFixed()) {
      entries = (Mask)(entries | digitToBit(cell.getValue()));
    }
  }

  SudokuRow out;
  for (int k = 0; k < 9; k++) {
    const SudokuCell &cell = row.at(k);
    if (cell.isFixed()) {
      out.set(k, cell);
      continue;
    }
    const Mask remaining = (Mask)(cell.getCandidateMask() & ~entries);
    if (remaining == 0) {
      return SudokuRow::contradiction();
    }
    const SudokuCell narrowed = SudokuCell::candidates(remaining);
    const Digit single = narrowed.getSingleCandidate();
    out.set(k, single != 0 ? SudokuCell::fixed(single) : narrowed);
  }

  // a fixed digit may now appear twice
  Mask seen = 0;
  for (int k = 0; k < 9; k++) {
    const SudokuCell &cell = out.at(k);
    if (!cell.isFixed()) {
      continue;
    }
    const Mask bit = digitToBit(cell.getValue());
    if ((seen & bit) != 0) {
      return SudokuRow::contradiction();
    }
    seen = (Mask)(seen | bit);
  }

  return out;
}

SudokuGrid refineRows(const SudokuGrid &grid) {
  if (grid.isContradiction()) {
    return grid;
  }
  SudokuGrid out(grid);
  for (int r = 0; r < 9; r++) {
    const SudokuRow refined = refineRow(grid.getRow(r));
    if (refined.isContradiction()) {
      return SudokuGrid::contradiction();
    }
    out.setRow(r, refined);
  }
  return out;
}

SudokuGrid refineRowsParallel(const SudokuGrid &grid) {
  if (grid.isContradiction()) {
    return grid;
  }

  TaskGroup<SudokuRow> group(9);
  for (int r = 0; r < 9; r++) {
    const SudokuRow row = grid.getRow(r);
    group.launch([row]() { return refineRow(row); });
  }
  const std::vector<SudokuRow> refined = group.join();

  SudokuGrid out(grid);
  for (int r = 0; r < 9; r++) {
    if (refined[(size_t)r].isContradiction()) {
      return SudokuGrid::contradiction();
    }
    out.setRow(r, refined[(size_t)r]);
  }
  return out;
}

// =========================================================
// Fixpoint
// =========================================================

typedef SudokuGrid (*RowPassFn)(const SudokuGrid &);

// One cycle = rows, then columns, then blocks; stops early on a contradiction.
static SudokuGrid refineCycle(const SudokuGrid &grid, RowPassFn pass) {
  SudokuGrid next = pass(grid);
  if (next.isContradiction()) {
    return next;
  }
  next = pass(next.transpose()).transpose();
  if (next.isContradiction()) {
    return next;
  }
  return pass(next.toBlockView()).fromBlockView();
}

static SudokuGrid refineToFixpoint(const SudokuGrid &grid, RowPassFn pass) {
  SudokuGrid current(grid);
  int cycles = 0;
  while (!current.isContradiction()) {
    const SudokuGrid next = refineCycle(current, pass);
    cycles++;
    if (next == current) {
      break;
    }
    current = next;
  }
  SUDOPAR_DEBUG("refine: %d cycle(s), %s", cycles, current.isContradiction() ? "contradiction" : "fixpoint");
  return current;
}

SudokuGrid refine(const SudokuGrid &grid) {
  return refineToFixpoint(grid, &refineRows);
}

SudokuGrid refineParallel(const SudokuGrid &grid) {
  return refineToFixpoint(grid, &refineRowsParallel);
}

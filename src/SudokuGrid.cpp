#include "SudokuGrid.hpp"

#include <stdexcept>
#include <string>
#include "utils.hpp"

// =========================================================
// SudokuGrid
// =========================================================

SudokuGrid::SudokuGrid() : contradicted(false) { }

SudokuGrid SudokuGrid::contradiction() {
  SudokuGrid grid;
  grid.contradicted = true;
  return grid;
}

bool SudokuGrid::isContradiction() const {
  return contradicted;
}

// --- cells API ---
const SudokuCell &SudokuGrid::getCell(Index idx) const {
  return cells[idx];
}

void SudokuGrid::setCell(Index idx, const SudokuCell &cell) {
  cells[idx] = cell;
}

const SudokuCell &SudokuGrid::valueAt(int i, int j) const {
  if (!isValidPosition(i, j)) {
    throw std::out_of_range("SudokuGrid::valueAt(" + std::to_string(i) + ", " + std::to_string(j) + ")");
  }
  return cells[ROW_CELLS[i - 1][j - 1]];
}

// --- rows API ---
SudokuRow SudokuGrid::getRow(int r) const {
  if (contradicted) {
    return SudokuRow::contradiction();
  }
  SudokuRow row;
  for (int k = 0; k < 9; k++) {
    row.set(k, cells[ROW_CELLS[r][k]]);
  }
  return row;
}

void SudokuGrid::setRow(int r, const SudokuRow &row) {
  if (row.isContradiction()) {
    contradicted = true;
    return;
  }
  for (int k = 0; k < 9; k++) {
    cells[ROW_CELLS[r][k]] = row.at(k);
  }
}

// --- transforms ---

// row u of the result is unit u of this grid
SudokuGrid SudokuGrid::permuted(const int (&unitCells)[9][9]) const {
  if (contradicted) {
    return contradiction();
  }
  SudokuGrid out;
  for (int u = 0; u < 9; u++) {
    for (int k = 0; k < 9; k++) {
      out.cells[ROW_CELLS[u][k]] = cells[unitCells[u][k]];
    }
  }
  return out;
}

// inverse of permuted()
SudokuGrid SudokuGrid::unpermuted(const int (&unitCells)[9][9]) const {
  if (contradicted) {
    return contradiction();
  }
  SudokuGrid out;
  for (int u = 0; u < 9; u++) {
    for (int k = 0; k < 9; k++) {
      out.cells[unitCells[u][k]] = cells[ROW_CELLS[u][k]];
    }
  }
  return out;
}

SudokuGrid SudokuGrid::transpose() const {
  return permuted(COL_CELLS);
}

SudokuGrid SudokuGrid::toBlockView() const {
  return permuted(BOX_CELLS);
}

SudokuGrid SudokuGrid::fromBlockView() const {
  return unpermuted(BOX_CELLS);
}

SudokuGrid SudokuGrid::replaceCell(int i, int j, const SudokuCell &cell) const {
  if (!isValidPosition(i, j)) {
    throw std::out_of_range("SudokuGrid::replaceCell(" + std::to_string(i) + ", " + std::to_string(j) + ")");
  }
  SudokuGrid out(*this);
  out.cells[ROW_CELLS[i - 1][j - 1]] = cell;
  return out;
}

bool SudokuGrid::isCompletelyDecided() const {
  if (contradicted) {
    return true;
  }
  for (const SudokuCell &cell : cells) {
    if (!cell.isDecided()) {
      return false;
    }
  }
  return true;
}

void SudokuGrid::exportToString(char *out81) const {
  for (int i = 0; i < 81; i++) {
    const SudokuCell &cell = cells[i];
    out81[i] = (!contradicted && cell.isFixed()) ? (char)('0' + cell.getValue()) : '.';
  }
  out81[81] = '\0';
}

bool SudokuGrid::operator==(const SudokuGrid &other) const {
  if (contradicted || other.contradicted) {
    return contradicted == other.contradicted;
  }
  for (int i = 0; i < 81; i++) {
    if (cells[i] != other.cells[i]) {
      return false;
    }
  }
  return true;
}

bool SudokuGrid::operator!=(const SudokuGrid &other) const {
  return !(*this == other);
}

// contradictions last, otherwise row-major cell order
bool SudokuGrid::operator<(const SudokuGrid &other) const {
  if (contradicted || other.contradicted) {
    return !contradicted && other.contradicted;
  }
  for (int i = 0; i < 81; i++) {
    if (cells[i] != other.cells[i]) {
      return cells[i] < other.cells[i];
    }
  }
  return false;
}

inline bool SudokuGrid::isValidPosition(int i, int j) {
  return i >= 1 && i <= 9 && j >= 1 && j <= 9;
}

#ifndef SUDOKU_GRID_H
#define SUDOKU_GRID_H

#include "SudokuCell.hpp"
#include "SudokuRow.hpp"

// Value type: every transform returns a new grid.
// A contradicted grid stands for "no solution" and compares equal to any other contradicted grid.
class SudokuGrid
{
public:
  // every cell holds all nine candidates
  SudokuGrid();

  static SudokuGrid contradiction();

  bool isContradiction() const;

  // --- cells API ---
  const SudokuCell &getCell(Index idx) const;

  void setCell(Index idx, const SudokuCell &cell);

  // 1-based (i, j), i = row, j = column
  const SudokuCell &valueAt(int i, int j) const;

  // --- rows API (0-based) ---
  SudokuRow getRow(int r) const;

  void setRow(int r, const SudokuRow &row);

  // --- transforms ---
  SudokuGrid transpose() const;

  SudokuGrid toBlockView() const;

  SudokuGrid fromBlockView() const;

  // 1-based (i, j); throws std::out_of_range outside [1, 9]
  SudokuGrid replaceCell(int i, int j, const SudokuCell &cell) const;

  // every cell fixed (or contradicted)
  bool isCompletelyDecided() const;

  // '.' for undecided cells, '.' everywhere for a contradiction
  void exportToString(char *out81) const;

  bool operator==(const SudokuGrid &other) const;
  bool operator!=(const SudokuGrid &other) const;
  bool operator<(const SudokuGrid &other) const;

private:
  SudokuCell cells[81];
  bool contradicted;

  static inline bool isValidPosition(int i, int j);

  SudokuGrid permuted(const int (&unitCells)[9][9]) const;
  SudokuGrid unpermuted(const int (&unitCells)[9][9]) const;
};

#endif // SUDOKU_GRID_H

#ifndef SUDOKU_ROW_H
#define SUDOKU_ROW_H

#include "SudokuCell.hpp"

// Nine cells read along a row, a column or a block.
class SudokuRow
{
public:
  SudokuRow();

  static SudokuRow contradiction();

  bool isContradiction() const;

  const SudokuCell &at(int k) const;

  void set(int k, const SudokuCell &cell);

  bool operator==(const SudokuRow &other) const;
  bool operator!=(const SudokuRow &other) const;

private:
  SudokuCell cells[9];
  bool contradicted;
};

#endif // SUDOKU_ROW_H

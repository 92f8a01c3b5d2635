#ifndef CONSTRAINT_ENGINE_H
#define CONSTRAINT_ENGINE_H

#include "Puzzle.hpp"
#include "SudokuGrid.hpp"
#include "SudokuRow.hpp"

// given digits become fixed cells, unknowns get all nine candidates
SudokuGrid fill(const Puzzle &puzzle);

// removes the row's fixed digits from every candidate set;
// contradiction on an emptied cell or a duplicate fixed digit
SudokuRow refineRow(const SudokuRow &row);

// refineRow on each of the nine rows, in order
SudokuGrid refineRows(const SudokuGrid &grid);

// refineRow on each of the nine rows, one task per row
SudokuGrid refineRowsParallel(const SudokuGrid &grid);

// row, column and block passes repeated until a fixpoint or a contradiction
SudokuGrid refine(const SudokuGrid &grid);

SudokuGrid refineParallel(const SudokuGrid &grid);

#endif // CONSTRAINT_ENGINE_H

#ifndef SEARCH_ENGINE_H
#define SEARCH_ENGINE_H

#include <vector>
#include "SudokuGrid.hpp"

// A cell to branch on; row and col are 1-based.
struct Guess {
  int row;
  int col;
  Mask candidates;
};

// true for a contradiction or when every cell is decided
bool solved(const SudokuGrid &grid);

// sum of candidate-set sizes, fixed cells count 0
int hardness(const SudokuGrid &grid);

// the undecided cell minimising (candidate count, row, col);
// throws std::logic_error when every cell is decided
Guess guess(const SudokuGrid &grid);

// one refined child per candidate of the guessed cell, contradictions dropped, easiest first
std::vector<SudokuGrid> guesses(const SudokuGrid &grid);

// depth-first search from a refined grid; returns a contradiction when no completion exists
SudokuGrid solveRefined(const SudokuGrid &grid);

SudokuGrid solveOne(const std::vector<SudokuGrid> &branches);

#endif // SEARCH_ENGINE_H

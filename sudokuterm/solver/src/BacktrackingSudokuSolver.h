#ifndef SUDOKUTERM_BACKTRACKINGSUDOKUSOLVER_H
#define SUDOKUTERM_BACKTRACKINGSUDOKUSOLVER_H

#include "SudokuSolver.h"

/**
 * Plain backtracking in row-major cell order, trying digits in ascending order. Solution counting uses the same
 * search with fewest-candidates cell selection.
 */
class BacktrackingSudokuSolver : public SudokuSolver
{
  public:
    ~BacktrackingSudokuSolver() override = default;

    [[nodiscard]] std::unique_ptr<SudokuGrid> solve(const SudokuGrid& sudoku) const override;

    [[nodiscard]] SolveTrace solveStepwise(const SudokuGrid& sudoku) const override;

    [[nodiscard]] size_t countSolutions(const SudokuGrid& sudoku, size_t limit) const override;
};

#endif // SUDOKUTERM_BACKTRACKINGSUDOKUSOLVER_H

#ifndef SUDOKUTERM_SUDOKUSOLVER_H
#define SUDOKUTERM_SUDOKUSOLVER_H

#include "SolveTrace.h"
#include "sudoku_grid.h"

#include <memory>

/**
 * Interface for a sudoku solving algorithm. Solvers never modify the grids passed to them.
 */
class SudokuSolver
{
  public:
    virtual ~SudokuSolver() = default;

    /**
     * Solves the given sudoku grid.
     * @param sudoku input sudoku grid
     * @return Pointer to the solution or nullptr if there is no solution to the grid.
     */
    [[nodiscard]] virtual std::unique_ptr<SudokuGrid> solve(const SudokuGrid& sudoku) const = 0;

    /**
     * Starts a search that is advanced step by step by the caller. Useful to visualize the search.
     */
    [[nodiscard]] virtual SolveTrace solveStepwise(const SudokuGrid& sudoku) const = 0;

    /**
     * Counts the solutions of the grid. The search stops as soon as limit solutions have been found.
     */
    [[nodiscard]] virtual size_t countSolutions(const SudokuGrid& sudoku, size_t limit) const = 0;

    static std::unique_ptr<SudokuSolver> create();
};

#endif // SUDOKUTERM_SUDOKUSOLVER_H

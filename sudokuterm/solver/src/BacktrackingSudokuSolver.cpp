#include "BacktrackingSudokuSolver.h"

std::unique_ptr<SudokuGrid>
BacktrackingSudokuSolver::solve(const SudokuGrid& sudoku) const
{
    SolveTrace trace(sudoku);
    trace.runToEnd();
    return trace.solution();
}

SolveTrace
BacktrackingSudokuSolver::solveStepwise(const SudokuGrid& sudoku) const
{
    return SolveTrace(sudoku);
}

size_t
BacktrackingSudokuSolver::countSolutions(const SudokuGrid& sudoku, size_t limit) const
{
    SolveTrace trace(sudoku, SearchPolicy{ CellOrder::FewestCandidates, nullptr });

    size_t found = 0;
    while (found < limit) {
        if (trace.runToEnd() != SolveOutcome::Solved) {
            break;
        }
        found++;
        if (!trace.resumeAfterSolution()) {
            break;
        }
    }
    return found;
}

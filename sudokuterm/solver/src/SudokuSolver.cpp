#include "SudokuSolver.h"
#include "BacktrackingSudokuSolver.h"

std::unique_ptr<SudokuSolver>
SudokuSolver::create()
{
    return std::make_unique<BacktrackingSudokuSolver>();
}

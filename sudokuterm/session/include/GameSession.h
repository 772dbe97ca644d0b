#ifndef SUDOKUTERM_GAMESESSION_H
#define SUDOKUTERM_GAMESESSION_H

#include "SolveTrace.h"
#include "SudokuGenerator.h"
#include "SudokuSolver.h"
#include "sudoku_grid.h"

#include <functional>
#include <memory>
#include <set>
#include <string>

struct CheckResult
{
    /**
     * True if the board is completely and correctly filled.
     */
    bool solved;
    /**
     * Player entered cells that conflict with another cell or differ from the puzzle's solution. Clues are never
     * reported.
     */
    std::set<CellPos> errors;
    size_t emptyCells;
};

struct SolveReport
{
    SolveOutcome outcome;
    size_t steps;
    bool abandoned;
};

struct CommandResult
{
    bool ok;
    bool quit;
    std::string message;
};

/**
 * Called after every step of an animated solve with the step and the search's current grid. Returning false
 * abandons the solve.
 */
using StepCallback = std::function<bool(const SolveStep&, const SudokuGrid&)>;

/**
 * State of one game: the active puzzle, the board the player edits and the cursor. Input errors are turned into
 * results with a message, they never escape as exceptions.
 */
class GameSession
{
    std::unique_ptr<SudokuGenerator> generator_;
    std::unique_ptr<SudokuSolver> solver_;
    std::unique_ptr<Puzzle> puzzle_;
    std::unique_ptr<SudokuGrid> board_;
    std::set<CellPos> markedErrors_;
    CellPos cursor_;

  public:
    GameSession(std::unique_ptr<SudokuGenerator> generator,
                std::unique_ptr<SudokuSolver> solver,
                Difficulty difficulty = Difficulty::Medium);

    /**
     * Replaces the puzzle and the board with a freshly generated puzzle.
     */
    void newGame(Difficulty difficulty);

    [[nodiscard]] const SudokuGrid& board() const noexcept;
    [[nodiscard]] const Puzzle& puzzle() const noexcept;
    [[nodiscard]] Difficulty difficulty() const noexcept;

    /**
     * Cells flagged by the last check. Cleared whenever the board changes.
     */
    [[nodiscard]] const std::set<CellPos>& markedErrors() const noexcept;

    [[nodiscard]] CellPos cursor() const noexcept;

    /**
     * Moves the cursor, wrapping around at the edges of the board.
     */
    void moveCursor(int dRow, int dCol);

    /**
     * Writes a digit to the cell under the cursor, 0 clears it.
     */
    CommandResult enterDigit(cell_t value);

    CheckResult check();

    /**
     * Solves the board as it is, including the player's entries. The board is only replaced if a solution is found
     * and the solve is not abandoned.
     */
    SolveReport solve(const StepCallback& onStep = {});

    /**
     * Removes every player entry.
     */
    void reset();

    /**
     * Parses and runs a command bar line.
     */
    CommandResult execute(const std::string& line, const StepCallback& onStep = {});
};

#endif // SUDOKUTERM_GAMESESSION_H

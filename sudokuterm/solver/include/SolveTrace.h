#ifndef SUDOKUTERM_SOLVETRACE_H
#define SUDOKUTERM_SOLVETRACE_H

#include "sudoku_grid.h"

#include <memory>
#include <optional>
#include <random>
#include <vector>

using RandomEngine = std::mt19937;

enum class StepKind
{
    Place,
    Retract
};

/**
 * A single change the search made to its grid.
 */
struct SolveStep
{
    CellPos pos;
    cell_t oldValue;
    cell_t newValue;
    StepKind kind;
};

enum class SolveOutcome
{
    Running,
    Solved,
    Unsolvable
};

enum class CellOrder
{
    /**
     * Always continue with the first empty cell in row-major order.
     */
    RowMajor,
    /**
     * Continue with the empty cell that has the fewest candidates. Dead ends are found much earlier, which makes
     * exhaustive searches like solution counting cheap.
     */
    FewestCandidates
};

struct SearchPolicy
{
    CellOrder cellOrder = CellOrder::RowMajor;
    /**
     * If set, the candidates of each cell are tried in a shuffled order drawn from this engine, otherwise in
     * ascending order. Not owned; must outlive the trace.
     */
    RandomEngine* shuffleEngine = nullptr;
};

/**
 * Backtracking search that can be advanced one placement or retraction at a time. The recursion of the classic
 * algorithm is replaced by an explicit stack of frames, so the search can be paused after every step and resumed
 * by the next call to next(). The trace works on its own copy of the input grid.
 */
class SolveTrace
{
    struct Frame
    {
        CellPos pos;
        std::vector<cell_t> candidates;
        size_t nextCandidate;
    };

    SudokuGrid grid;
    SearchPolicy policy;
    std::vector<Frame> frames;
    SolveOutcome state;
    bool descend;
    size_t stepCount;

    [[nodiscard]] std::optional<CellPos> selectNextCell() const;

  public:
    explicit SolveTrace(const SudokuGrid& sudoku, SearchPolicy policy = {});

    /**
     * Advances the search by exactly one placement or retraction.
     * @return The step taken, or nothing once the search has ended. Check outcome() for the result.
     */
    std::optional<SolveStep> next();

    /**
     * Runs the search until it is solved or exhausted without reporting the individual steps.
     */
    SolveOutcome runToEnd();

    /**
     * Continues a solved search to look for the next solution. Returns false if there is nothing left to explore,
     * in which case the outcome becomes Unsolvable.
     */
    bool resumeAfterSolution();

    [[nodiscard]] SolveOutcome outcome() const noexcept;

    [[nodiscard]] bool finished() const noexcept;

    /**
     * The grid as left by the last step.
     */
    [[nodiscard]] const SudokuGrid& current() const noexcept;

    /**
     * @return Copy of the completed grid or nullptr if the search has not found a solution (yet).
     */
    [[nodiscard]] std::unique_ptr<SudokuGrid> solution() const;

    /**
     * Number of placements and retractions performed so far.
     */
    [[nodiscard]] size_t steps() const noexcept;
};

/**
 * Lists the digits that can be placed in the cell without repeating a digit of its row, column or box, in ascending
 * order.
 */
std::vector<cell_t>
getCellPossibilities(const SudokuGrid& grid, size_t row, size_t col);

#endif // SUDOKUTERM_SOLVETRACE_H

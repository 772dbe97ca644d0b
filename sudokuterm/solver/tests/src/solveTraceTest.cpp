#include "gtest/gtest.h"

#include <map>
#include <sstream>

#include <SolveTrace.h>
#include <SudokuSolver.h>

namespace {

const char* const puzzle = "53..7....6..195....98....6.8...6...34..8.3..17...2...6.6....28....419..5....8..79";
const char* const solution = "534678912672195348198342567859761423426853791713924856961537284287419635345286179";

TEST(solve_trace, test_complete_grid_yields_no_steps)
{
    const auto grid = SudokuGrid::fromString(solution);
    const auto solver = SudokuSolver::create();
    auto trace = solver->solveStepwise(grid);

    EXPECT_FALSE(trace.next().has_value());
    EXPECT_EQ(trace.outcome(), SolveOutcome::Solved);
    EXPECT_TRUE(trace.finished());
    EXPECT_EQ(trace.steps(), 0);
    ASSERT_NE(trace.solution(), nullptr);
    EXPECT_EQ(*trace.solution(), grid);
}

TEST(solve_trace, test_stepwise_matches_silent_solve)
{
    const auto grid = SudokuGrid::fromString(puzzle);
    const auto solver = SudokuSolver::create();

    auto trace = solver->solveStepwise(grid);
    size_t count = 0;
    while (trace.next()) {
        count++;
    }

    EXPECT_EQ(trace.outcome(), SolveOutcome::Solved);
    EXPECT_EQ(trace.steps(), count);
    ASSERT_NE(trace.solution(), nullptr);
    EXPECT_EQ(*trace.solution(), SudokuGrid::fromString(solution));
    EXPECT_EQ(*trace.solution(), *solver->solve(grid));
}

TEST(solve_trace, test_replaying_steps_reproduces_grid)
{
    const auto grid = SudokuGrid::fromString(puzzle);
    auto replay = grid.clone();
    std::map<CellPos, cell_t> placed;
    size_t retractions = 0;

    SolveTrace trace(grid);
    while (const auto step = trace.next()) {
        EXPECT_EQ(replay.get(step->pos.row, step->pos.col), step->oldValue);
        EXPECT_FALSE(grid.isCellFilled(step->pos.row, step->pos.col)) << "givens are never touched";

        if (step->kind == StepKind::Place) {
            EXPECT_EQ(step->oldValue, 0);
            EXPECT_NE(step->newValue, 0);
            EXPECT_TRUE(replay.isLegalPlacement(step->pos.row, step->pos.col, step->newValue));
            placed[step->pos] = step->newValue;
        } else {
            EXPECT_EQ(step->newValue, 0);
            EXPECT_EQ(placed[step->pos], step->oldValue);
            placed.erase(step->pos);
            retractions++;
        }

        replay.set(step->pos.row, step->pos.col, step->newValue);
        EXPECT_EQ(replay, trace.current());
    }

    EXPECT_GT(retractions, 0);
    EXPECT_EQ(replay, SudokuGrid::fromString(solution));
}

TEST(solve_trace, test_abandoned_trace_leaves_input_untouched)
{
    const auto grid = SudokuGrid::fromString(puzzle);
    const auto solver = SudokuSolver::create();
    {
        auto trace = solver->solveStepwise(grid);
        for (int i = 0; i < 10; i++) {
            ASSERT_TRUE(trace.next().has_value());
        }
        EXPECT_EQ(trace.outcome(), SolveOutcome::Running);
        EXPECT_FALSE(trace.finished());
        EXPECT_EQ(trace.solution(), nullptr);
        EXPECT_NE(trace.current(), grid);
    }
    EXPECT_EQ(grid, SudokuGrid::fromString(puzzle));
}

TEST(solve_trace, test_conflicting_givens_are_unsolvable)
{
    SudokuGrid grid;
    grid.set(0, 0, 5);
    grid.set(0, 1, 5);

    SolveTrace trace(grid);
    EXPECT_TRUE(trace.finished());
    EXPECT_FALSE(trace.next().has_value());
    EXPECT_EQ(trace.outcome(), SolveOutcome::Unsolvable);
    EXPECT_EQ(trace.steps(), 0);
    EXPECT_EQ(trace.solution(), nullptr);
}

TEST(solve_trace, test_dead_end_is_unsolvable)
{
    auto grid = SudokuGrid::fromString(puzzle);
    // 1 is a candidate for (0,2), but the only solution needs a 4 there
    ASSERT_TRUE(grid.isLegalPlacement(0, 2, 1));
    grid.set(0, 2, 1);

    const auto solver = SudokuSolver::create();
    auto trace = solver->solveStepwise(grid);
    EXPECT_FALSE(trace.finished());
    while (trace.next()) {
    }
    EXPECT_GT(trace.steps(), 0);
    EXPECT_EQ(trace.outcome(), SolveOutcome::Unsolvable);
    EXPECT_EQ(trace.solution(), nullptr);
    EXPECT_EQ(trace.current(), grid);
}

TEST(solve_trace, test_resume_after_unique_solution)
{
    SolveTrace trace(SudokuGrid::fromString(puzzle));
    ASSERT_EQ(trace.runToEnd(), SolveOutcome::Solved);
    ASSERT_TRUE(trace.resumeAfterSolution());
    EXPECT_EQ(trace.runToEnd(), SolveOutcome::Unsolvable);
    EXPECT_FALSE(trace.resumeAfterSolution());
}

TEST(solve_trace, test_shuffled_fill_is_seeded)
{
    RandomEngine engine1(1234);
    RandomEngine engine2(1234);
    SolveTrace fill1(SudokuGrid(9), SearchPolicy{ CellOrder::RowMajor, &engine1 });
    SolveTrace fill2(SudokuGrid(9), SearchPolicy{ CellOrder::RowMajor, &engine2 });

    ASSERT_EQ(fill1.runToEnd(), SolveOutcome::Solved);
    ASSERT_EQ(fill2.runToEnd(), SolveOutcome::Solved);
    EXPECT_TRUE(fill1.current().isComplete());
    EXPECT_EQ(fill1.current(), fill2.current());
}

TEST(solve_trace, test_ascending_fill_of_empty_grid)
{
    SolveTrace fill{ SudokuGrid(9) };
    ASSERT_EQ(fill.runToEnd(), SolveOutcome::Solved);
    std::stringstream row;
    for (size_t col = 0; col < 9; col++) {
        row << fill.current().get(0, col);
    }
    EXPECT_EQ(row.str(), "123456789");
}

TEST(solve_trace, test_possibilities)
{
    const auto grid = SudokuGrid::fromString(puzzle);
    // row 0: 5 3 7, col 2: 8, box 0: 5 3 6 9 8
    const std::vector<cell_t> expected{ 1, 2, 4 };
    EXPECT_EQ(getCellPossibilities(grid, 0, 2), expected);
}
}

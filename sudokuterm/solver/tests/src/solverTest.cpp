#include "gtest/gtest.h"

#include <iostream>
#include <string>

#include <SudokuSolver.h>
#include <test_helper.h>

namespace {

const char* const hardPuzzle = "4.....8.5.3..........7......2.....6.....8.4......1.......6.3.7.5..2.....1.4......";
const char* const hardSolution = "417369825632158947958724316825437169791586432346912758289643571573291684164875293";

TEST(solver, test_test_sudokus)
{
    const auto solver = SudokuSolver::create();
    const auto challenges = readSudokuChallenges(SUDOKUTERM_SOLVER_TEST_DATA);
    ASSERT_FALSE(challenges.empty());

    for (const auto& challenge : challenges) {
        const auto result = solver->solve(challenge.grid);
        EXPECT_NE(result, nullptr);

        if (result) {
            int errCnt = 0;
            if (!challenge.isValidSolution(result.get(), &errCnt)) {
                std::cout << "Failed with " << errCnt << " errors." << std::endl;
                SudokuGrid::printGrid(std::cout, *result, false);

                std::cout << *result << '\n';
                std::cout << challenge.solution << '\n';
                std::cout << challenge.grid << '\n';
            }
            EXPECT_EQ(errCnt, 0);
            EXPECT_TRUE(result->isComplete());
        }
    }
}

TEST(solver, test_solve_does_not_modify_input)
{
    const auto solver = SudokuSolver::create();
    const auto challenges = readSudokuChallenges(SUDOKUTERM_SOLVER_TEST_DATA);
    ASSERT_FALSE(challenges.empty());

    const auto input = challenges.front().grid.clone();
    const auto result = solver->solve(input);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(input, challenges.front().grid);
    EXPECT_EQ(input.filledCount(), challenges.front().grid.filledCount());
}

TEST(solver, test_solve_keeps_fixed_cells)
{
    const auto solver = SudokuSolver::create();
    auto grid = SudokuGrid::fromString("53..7....6..195....98....6.8...6...34..8.3..17...2...6.6....28....419..5....8..79");
    grid.lockFilledCells();

    const auto result = solver->solve(grid);
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(result->isFixed(0, 0));
    EXPECT_FALSE(result->isFixed(0, 2));
    EXPECT_EQ(result->get(0, 2), 4);
}

TEST(solver, test_unsolvable_conflicting_givens)
{
    const auto solver = SudokuSolver::create();
    SudokuGrid grid;
    grid.set(0, 0, 5);
    grid.set(0, 1, 5);

    EXPECT_EQ(solver->solve(grid), nullptr);
    EXPECT_EQ(solver->countSolutions(grid, 2), 0);
}

TEST(solver, test_unsolvable_without_direct_conflict)
{
    const auto solver = SudokuSolver::create();
    // Cell (0,8) can neither hold 1-8 (row) nor 9 (column).
    auto grid = SudokuGrid::fromString("12345678."
                                       "........9"
                                       "........."
                                       "........."
                                       "........."
                                       "........."
                                       "........."
                                       "........."
                                       ".........");
    EXPECT_TRUE(grid.findErrors().empty());
    EXPECT_EQ(solver->solve(grid), nullptr);
    EXPECT_EQ(solver->countSolutions(grid, 2), 0);
}

TEST(solver, test_solve_complete_grid)
{
    const auto solver = SudokuSolver::create();
    const auto grid = SudokuGrid::fromString(hardSolution);

    const auto result = solver->solve(grid);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(*result, grid);
    EXPECT_EQ(solver->countSolutions(grid, 2), 1);
}

TEST(solver, test_count_unique)
{
    const auto solver = SudokuSolver::create();
    const auto challenges = readSudokuChallenges(SUDOKUTERM_SOLVER_TEST_DATA);
    for (const auto& challenge : challenges) {
        EXPECT_EQ(solver->countSolutions(challenge.grid, 2), 1) << challenge.grid;
    }

    EXPECT_EQ(solver->countSolutions(SudokuGrid::fromString(hardPuzzle), 2), 1);
}

TEST(solver, test_count_stops_at_limit)
{
    const auto solver = SudokuSolver::create();
    const SudokuGrid empty;
    EXPECT_EQ(solver->countSolutions(empty, 0), 0);
    EXPECT_EQ(solver->countSolutions(empty, 1), 1);
    EXPECT_EQ(solver->countSolutions(empty, 2), 2);
    EXPECT_EQ(solver->countSolutions(empty, 5), 5);

    // Removing one clue of the hard puzzle opens up a second solution.
    auto grid = SudokuGrid::fromString(hardPuzzle);
    grid.set(0, 0, 0);
    EXPECT_EQ(solver->countSolutions(grid, 2), 2);
    EXPECT_EQ(grid.get(0, 0), 0);
    EXPECT_EQ(grid.filledCount(), 16);
}

TEST(solver, test_fewest_candidates_order_finds_solution)
{
    const auto grid = SudokuGrid::fromString(hardPuzzle);

    auto trace = SolveTrace(grid, SearchPolicy{ CellOrder::FewestCandidates, nullptr });
    ASSERT_EQ(trace.runToEnd(), SolveOutcome::Solved);
    EXPECT_EQ(*trace.solution(), SudokuGrid::fromString(hardSolution));
}

TEST(solver, test_solve_4x4)
{
    const auto solver = SudokuSolver::create();
    const auto grid = SudokuGrid::fromString("1..."
                                             "..2."
                                             ".3.."
                                             "...4",
                                             4);
    const auto result = solver->solve(grid);
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(result->isComplete());
    EXPECT_EQ(result->get(0, 0), 1);
    EXPECT_EQ(result->get(3, 3), 4);
}

TEST(solver, test_malformed_challenge_line)
{
    const std::string puzzle(81, '.');
    EXPECT_THROW(SudokuChallenge{ "" }, std::invalid_argument);
    EXPECT_THROW(SudokuChallenge{ puzzle }, std::invalid_argument);
    EXPECT_THROW(SudokuChallenge{ puzzle + ";" + std::string(40, '1') }, std::invalid_argument);
    EXPECT_THROW(SudokuChallenge{ puzzle + "," + hardSolution }, std::invalid_argument);

    try {
        SudokuChallenge challenge("123;456");
        FAIL() << "short line accepted";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("Malformed challenge line"), std::string::npos);
    }

    const SudokuChallenge challenge(std::string(hardPuzzle) + ";" + hardSolution);
    EXPECT_EQ(challenge.solution, SudokuGrid::fromString(hardSolution));
}
}

#ifndef SUDOKUTERM_SUDOKUGENERATOR_H
#define SUDOKUTERM_SUDOKUGENERATOR_H

#include "SolveTrace.h"
#include "SudokuSolver.h"
#include "sudoku_grid.h"

#include <memory>
#include <optional>
#include <string>

enum class Difficulty
{
    Easy,
    Medium,
    Hard
};

const char*
difficultyName(Difficulty difficulty);

/**
 * Accepts "easy", "medium" and "hard".
 */
std::optional<Difficulty>
parseDifficulty(const std::string& name);

/**
 * Inclusive range of clue counts a carved puzzle should end up with.
 */
struct ClueRange
{
    size_t min;
    size_t max;
};

struct GeneratorConfig
{
    ClueRange easy{ 46, 50 };
    ClueRange medium{ 36, 40 };
    ClueRange hard{ 28, 31 };
    int maxFillAttempts = 3;

    /**
     * @throws std::invalid_argument if a range is inverted, leaves [17, 81] or the tiers overlap
     */
    void validate() const;

    [[nodiscard]] const ClueRange& cluesFor(Difficulty difficulty) const;
};

/**
 * A carved grid with its clues fixed, together with its only solution.
 */
struct Puzzle
{
    Difficulty difficulty;
    SudokuGrid grid;
    SudokuGrid solution;

    [[nodiscard]] size_t clueCount() const { return grid.filledCount(); }
};

class SudokuGenerator
{
    GeneratorConfig config;
    RandomEngine engine;
    std::unique_ptr<SudokuSolver> solver;

    std::unique_ptr<SudokuGrid> fillGrid();

    size_t carve(SudokuGrid& grid, size_t targetClues);

  public:
    /**
     * Creates a generator that produces the same sequence of puzzles for the same seed.
     */
    explicit SudokuGenerator(RandomEngine::result_type seed, GeneratorConfig config = {});

    /**
     * Creates a generator seeded from std::random_device.
     */
    SudokuGenerator();

    /**
     * Generates a puzzle with exactly one solution. If the carving cannot reach the targeted clue count while keeping
     * the solution unique, the puzzle keeps the closest achievable number of clues.
     */
    [[nodiscard]] std::unique_ptr<Puzzle> generate(Difficulty difficulty);

    [[nodiscard]] const GeneratorConfig& getConfig() const noexcept;
};

#endif // SUDOKUTERM_SUDOKUGENERATOR_H

#include "SudokuGenerator.h"

#include "log.h"

#include <algorithm>
#include <chrono>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

namespace {
// Fewer clues than this never give a unique solution.
constexpr size_t minUniqueClues = 17;

void
validateRange(const char* name, const ClueRange& range)
{
    if (range.min > range.max || range.min < minUniqueClues || range.max > 81) {
        throw std::invalid_argument(
          fmt::format("Invalid clue range for {}: [{}, {}].", name, range.min, range.max));
    }
}
}

const char*
difficultyName(Difficulty difficulty)
{
    switch (difficulty) {
        case Difficulty::Easy:
            return "easy";
        case Difficulty::Medium:
            return "medium";
        case Difficulty::Hard:
            return "hard";
    }
    return "unknown";
}

std::optional<Difficulty>
parseDifficulty(const std::string& name)
{
    for (const auto difficulty : { Difficulty::Easy, Difficulty::Medium, Difficulty::Hard }) {
        if (name == difficultyName(difficulty)) {
            return difficulty;
        }
    }
    return std::nullopt;
}

void
GeneratorConfig::validate() const
{
    validateRange("easy", easy);
    validateRange("medium", medium);
    validateRange("hard", hard);
    if (easy.min <= medium.max || medium.min <= hard.max) {
        throw std::invalid_argument("Clue ranges must decrease from easy over medium to hard without overlapping.");
    }
    if (maxFillAttempts < 1) {
        throw std::invalid_argument("At least one fill attempt is required.");
    }
}

const ClueRange&
GeneratorConfig::cluesFor(Difficulty difficulty) const
{
    switch (difficulty) {
        case Difficulty::Easy:
            return easy;
        case Difficulty::Medium:
            return medium;
        case Difficulty::Hard:
            return hard;
    }
    throw std::invalid_argument("Invalid difficulty.");
}

SudokuGenerator::SudokuGenerator(RandomEngine::result_type seed, GeneratorConfig config)
  : config(config)
  , engine(seed)
  , solver(SudokuSolver::create())
{
    this->config.validate();
    LOGD("Generator seeded with {}", seed);
}

SudokuGenerator::SudokuGenerator()
  : SudokuGenerator(std::random_device{}())
{}

std::unique_ptr<SudokuGrid>
SudokuGenerator::fillGrid()
{
    for (int attempt = 1; attempt <= config.maxFillAttempts; attempt++) {
        SolveTrace trace(SudokuGrid(9), SearchPolicy{ CellOrder::RowMajor, &engine });
        if (trace.runToEnd() == SolveOutcome::Solved) {
            LOGD("Filled grid after {} steps", trace.steps());
            return trace.solution();
        }
        LOGW("Filling an empty grid failed (attempt {} of {})", attempt, config.maxFillAttempts);
    }
    throw std::runtime_error("Could not fill an empty grid.");
}

size_t
SudokuGenerator::carve(SudokuGrid& grid, size_t targetClues)
{
    std::vector<size_t> order(grid.size());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), engine);

    size_t clues = grid.filledCount();
    size_t attempts = 0;
    for (const auto idx : order) {
        if (clues <= targetClues) {
            break;
        }
        const size_t row = idx / grid.sideLen;
        const size_t col = idx % grid.sideLen;
        const cell_t digit = grid.get(row, col);

        grid.set(row, col, 0);
        attempts++;
        if (solver->countSolutions(grid, 2) == 1) {
            clues--;
        } else {
            // Removing this clue allows a second solution; it stays for the rest of the pass.
            grid.set(row, col, digit);
        }
    }
    LOGD("Carving tried {} cells", attempts);
    return clues;
}

std::unique_ptr<Puzzle>
SudokuGenerator::generate(Difficulty difficulty)
{
    const auto start = std::chrono::steady_clock::now();

    const auto& range = config.cluesFor(difficulty);
    std::uniform_int_distribution<size_t> targetDist(range.min, range.max);
    const size_t target = targetDist(engine);

    auto solution = fillGrid();
    SudokuGrid grid = solution->clone();
    const size_t clues = carve(grid, target);
    grid.lockFilledCells();

    if (clues > target) {
        LOGI("Could only carve down to {} clues, targeted {}", clues, target);
    }

    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
    LOGI("Generated {} puzzle with {} clues in {:.1f}ms", difficultyName(difficulty), clues, elapsed.count());

    return std::make_unique<Puzzle>(Puzzle{ difficulty, std::move(grid), std::move(*solution) });
}

const GeneratorConfig&
SudokuGenerator::getConfig() const noexcept
{
    return config;
}

#include "GameSession.h"

#include "log.h"
#include "session_command.h"

#include <fmt/format.h>

GameSession::GameSession(std::unique_ptr<SudokuGenerator> generator,
                         std::unique_ptr<SudokuSolver> solver,
                         Difficulty difficulty)
  : generator_(std::move(generator))
  , solver_(std::move(solver))
  , cursor_{ 0, 0 }
{
    newGame(difficulty);
}

void
GameSession::newGame(Difficulty difficulty)
{
    puzzle_ = generator_->generate(difficulty);
    board_ = std::make_unique<SudokuGrid>(puzzle_->grid);
    markedErrors_.clear();
    cursor_ = { 0, 0 };
}

const SudokuGrid&
GameSession::board() const noexcept
{
    return *board_;
}

const Puzzle&
GameSession::puzzle() const noexcept
{
    return *puzzle_;
}

Difficulty
GameSession::difficulty() const noexcept
{
    return puzzle_->difficulty;
}

const std::set<CellPos>&
GameSession::markedErrors() const noexcept
{
    return markedErrors_;
}

CellPos
GameSession::cursor() const noexcept
{
    return cursor_;
}

void
GameSession::moveCursor(int dRow, int dCol)
{
    const int side = static_cast<int>(board_->sideLen);
    const int row = ((static_cast<int>(cursor_.row) + dRow) % side + side) % side;
    const int col = ((static_cast<int>(cursor_.col) + dCol) % side + side) % side;
    cursor_ = { static_cast<size_t>(row), static_cast<size_t>(col) };
}

CommandResult
GameSession::enterDigit(cell_t value)
{
    try {
        board_->set(cursor_.row, cursor_.col, value);
    } catch (const SudokuError& e) {
        LOGD("Rejected input {} at ({}, {}): {}", value, cursor_.row, cursor_.col, e.what());
        return { false, false, e.what() };
    }
    markedErrors_.clear();
    return { true, false, "" };
}

CheckResult
GameSession::check()
{
    CheckResult result{ board_->isComplete(), {}, board_->size() - board_->filledCount() };

    const auto conflicts = board_->findErrors();
    for (size_t row = 0; row < board_->sideLen; row++) {
        for (size_t col = 0; col < board_->sideLen; col++) {
            const cell_t value = board_->get(row, col);
            if (value == 0 || board_->isFixed(row, col)) {
                continue;
            }
            if (conflicts.count({ row, col }) > 0 || value != puzzle_->solution.get(row, col)) {
                result.errors.insert({ row, col });
            }
        }
    }

    markedErrors_ = result.errors;
    LOGI("Check: solved={} errors={} empty={}", result.solved, result.errors.size(), result.emptyCells);
    return result;
}

SolveReport
GameSession::solve(const StepCallback& onStep)
{
    auto trace = solver_->solveStepwise(*board_);
    while (const auto step = trace.next()) {
        if (onStep && !onStep(*step, trace.current())) {
            LOGI("Solve abandoned after {} steps", trace.steps());
            return { trace.outcome(), trace.steps(), true };
        }
    }

    if (trace.outcome() == SolveOutcome::Solved) {
        board_ = trace.solution();
        markedErrors_.clear();
        LOGI("Solved board in {} steps", trace.steps());
    } else {
        LOGI("Board has no solution, gave up after {} steps", trace.steps());
    }
    return { trace.outcome(), trace.steps(), false };
}

void
GameSession::reset()
{
    board_->clearUnfixed();
    markedErrors_.clear();
}

CommandResult
GameSession::execute(const std::string& line, const StepCallback& onStep)
{
    const auto command = parseCommand(line);
    if (!command) {
        LOGD("Unknown command '{}'", line);
        return { false, false, fmt::format("Unknown command: {}", line) };
    }

    switch (command->type) {
        case CommandType::Quit:
            return { true, true, "" };
        case CommandType::Check: {
            const auto result = check();
            if (result.solved) {
                return { true, false, "Solved, well done!" };
            }
            if (!result.errors.empty()) {
                return { true, false, fmt::format("{} mistake(s) marked.", result.errors.size()) };
            }
            return { true, false, fmt::format("No mistakes so far, {} cell(s) left.", result.emptyCells) };
        }
        case CommandType::Solve: {
            const auto report = solve(onStep);
            if (report.abandoned) {
                return { true, false, "Solve abandoned." };
            }
            if (report.outcome == SolveOutcome::Solved) {
                return { true, false, fmt::format("Solved in {} steps.", report.steps) };
            }
            return { false, false, "No solution from the current state." };
        }
        case CommandType::NewGame:
            newGame(command->difficulty);
            return { true,
                     false,
                     fmt::format("New {} puzzle with {} clues.",
                                 difficultyName(puzzle_->difficulty),
                                 puzzle_->clueCount()) };
        case CommandType::Reset:
            reset();
            return { true, false, "Board reset." };
    }
    return { false, false, "Unhandled command." };
}

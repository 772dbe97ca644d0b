#include "SolveTrace.h"

#include <algorithm>

std::vector<cell_t>
getCellPossibilities(const SudokuGrid& grid, size_t row, size_t col)
{
    std::vector<bool> candidates(grid.sideLen + 1, true);

    // check row and col
    for (size_t i = 0; i < grid.sideLen; i++) {
        candidates.at(grid.get(i, col)) = false;
        candidates.at(grid.get(row, i)) = false;
    }

    // check box
    const size_t boxRow = row / grid.boxLen;
    const size_t boxCol = col / grid.boxLen;
    for (size_t i = boxRow * grid.boxLen; i < boxRow * grid.boxLen + grid.boxLen; i++) {
        for (size_t j = boxCol * grid.boxLen; j < boxCol * grid.boxLen + grid.boxLen; j++) {
            candidates.at(grid.get(i, j)) = false;
        }
    }

    std::vector<cell_t> numbers;
    for (size_t num = 1; num <= grid.sideLen; num++) {
        if (candidates.at(num)) {
            numbers.push_back(static_cast<cell_t>(num));
        }
    }
    return numbers;
}

SolveTrace::SolveTrace(const SudokuGrid& sudoku, SearchPolicy policy)
  : grid(sudoku)
  , policy(policy)
  , state(SolveOutcome::Running)
  , descend(true)
  , stepCount(0)
{
    // Givens that already contradict each other cannot be completed; the search would only fill around them.
    if (!grid.findErrors().empty()) {
        state = SolveOutcome::Unsolvable;
    }
}

std::optional<CellPos>
SolveTrace::selectNextCell() const
{
    std::optional<CellPos> best;
    size_t minCandidates = grid.sideLen + 1;

    for (size_t row = 0; row < grid.sideLen; row++) {
        for (size_t col = 0; col < grid.sideLen; col++) {
            if (grid.isCellFilled(row, col)) {
                continue;
            }
            if (policy.cellOrder == CellOrder::RowMajor) {
                return CellPos{ row, col };
            }

            const size_t numCandidates = getCellPossibilities(grid, row, col).size();
            if (numCandidates < minCandidates) {
                best = CellPos{ row, col };
                minCandidates = numCandidates;
                if (numCandidates <= 1) {
                    return best;
                }
            }
        }
    }
    return best;
}

std::optional<SolveStep>
SolveTrace::next()
{
    while (state == SolveOutcome::Running) {
        if (descend) {
            descend = false;
            const auto cell = selectNextCell();
            if (!cell) {
                state = SolveOutcome::Solved;
                return std::nullopt;
            }

            auto candidates = getCellPossibilities(grid, cell->row, cell->col);
            if (policy.shuffleEngine != nullptr) {
                std::shuffle(candidates.begin(), candidates.end(), *policy.shuffleEngine);
            }
            frames.push_back(Frame{ *cell, std::move(candidates), 0 });
        }

        auto& frame = frames.back();
        const CellPos pos = frame.pos;

        // Coming back to a frame whose cell is still filled means everything below it failed.
        const cell_t placed = grid.get(pos.row, pos.col);
        if (placed != 0) {
            grid.set(pos.row, pos.col, 0);
            stepCount++;
            return SolveStep{ pos, placed, 0, StepKind::Retract };
        }

        while (frame.nextCandidate < frame.candidates.size()) {
            const cell_t digit = frame.candidates[frame.nextCandidate++];
            if (grid.isLegalPlacement(pos.row, pos.col, digit)) {
                grid.set(pos.row, pos.col, digit);
                descend = true;
                stepCount++;
                return SolveStep{ pos, 0, digit, StepKind::Place };
            }
        }

        // All candidates exhausted, backtrack one level.
        frames.pop_back();
        if (frames.empty()) {
            state = SolveOutcome::Unsolvable;
        }
    }
    return std::nullopt;
}

SolveOutcome
SolveTrace::runToEnd()
{
    while (next()) {
    }
    return state;
}

bool
SolveTrace::resumeAfterSolution()
{
    if (state != SolveOutcome::Solved) {
        return false;
    }
    if (frames.empty()) {
        // The input was already complete, there is no other way to fill it.
        state = SolveOutcome::Unsolvable;
        return false;
    }
    state = SolveOutcome::Running;
    descend = false;
    return true;
}

SolveOutcome
SolveTrace::outcome() const noexcept
{
    return state;
}

bool
SolveTrace::finished() const noexcept
{
    return state != SolveOutcome::Running;
}

const SudokuGrid&
SolveTrace::current() const noexcept
{
    return grid;
}

std::unique_ptr<SudokuGrid>
SolveTrace::solution() const
{
    if (state != SolveOutcome::Solved) {
        return nullptr;
    }
    return std::make_unique<SudokuGrid>(grid);
}

size_t
SolveTrace::steps() const noexcept
{
    return stepCount;
}

#ifndef SUDOKUTERM_BOARD_VIEW_H
#define SUDOKUTERM_BOARD_VIEW_H

#include "GameSession.h"
#include "terminal.h"

#include <optional>
#include <string>

/**
 * Draws the board, a title and a status line centered on the terminal.
 */
class BoardView
{
    Terminal& terminal;

    [[nodiscard]] int top() const;
    [[nodiscard]] int left() const;

    void drawGrid(const SudokuGrid& grid,
                  const std::set<CellPos>& errors,
                  const std::optional<CellPos>& highlight) const;

    void drawTooSmall() const;

  public:
    static constexpr int boardWidth = 25;
    static constexpr int boardHeight = 13;
    // title, blank line, board, blank line, status line, command line
    static constexpr int minRows = boardHeight + 5;
    static constexpr int minCols = 40;

    explicit BoardView(Terminal& terminal);

    [[nodiscard]] bool fitsScreen() const;

    /**
     * Screen line used for the command bar.
     */
    [[nodiscard]] int commandLine() const;

    void render(const GameSession& session, const std::string& status) const;

    /**
     * Shows a grid of a running search, with the cell changed by the step highlighted.
     */
    void renderSearch(const GameSession& session, const SudokuGrid& grid, const SolveStep& step) const;
};

#endif // SUDOKUTERM_BOARD_VIEW_H

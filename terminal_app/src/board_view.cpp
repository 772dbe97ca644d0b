#include "board_view.h"

#include <fmt/format.h>
#include <ncurses.h>

namespace {
int
cellY(size_t row)
{
    return static_cast<int>(1 + row + row / 3);
}

int
cellX(size_t col)
{
    return static_cast<int>(2 + col * 2 + (col / 3) * 2);
}

void
drawCentered(int y, const std::string& text)
{
    const int x = (getmaxx(stdscr) - static_cast<int>(text.size())) / 2;
    mvaddstr(y, x < 0 ? 0 : x, text.c_str());
}
}

BoardView::BoardView(Terminal& terminal)
  : terminal(terminal)
{}

int
BoardView::top() const
{
    return (terminal.rows() - minRows) / 2;
}

int
BoardView::left() const
{
    return (terminal.cols() - boardWidth) / 2;
}

bool
BoardView::fitsScreen() const
{
    return terminal.rows() >= minRows && terminal.cols() >= minCols;
}

int
BoardView::commandLine() const
{
    return terminal.rows() - 1;
}

void
BoardView::drawTooSmall() const
{
    erase();
    mvaddstr(0, 0, fmt::format("Terminal too small, need {}x{}.", minCols, minRows).c_str());
    curs_set(0);
    refresh();
}

void
BoardView::drawGrid(const SudokuGrid& grid,
                    const std::set<CellPos>& errors,
                    const std::optional<CellPos>& highlight) const
{
    const int boardTop = top() + 2;
    const int boardLeft = left();

    for (int line = 0; line < boardHeight; line += 4) {
        mvaddstr(boardTop + line, boardLeft, "+-------+-------+-------+");
    }
    for (size_t row = 0; row < grid.sideLen; row++) {
        const int y = boardTop + cellY(row);
        for (int x = 0; x < boardWidth; x += 8) {
            mvaddch(y, boardLeft + x, '|');
        }

        for (size_t col = 0; col < grid.sideLen; col++) {
            const cell_t value = grid.get(row, col);
            attr_t attrs = A_NORMAL;
            short pair = Terminal::Default;
            if (grid.isFixed(row, col)) {
                attrs |= A_BOLD;
            }
            if (errors.count({ row, col }) > 0) {
                attrs |= terminal.hasColors() ? A_NORMAL : A_UNDERLINE;
                pair = Terminal::Error;
            }
            if (highlight && *highlight == CellPos{ row, col }) {
                attrs |= A_REVERSE;
                pair = Terminal::Search;
            }

            if (terminal.hasColors()) {
                attrs |= COLOR_PAIR(pair);
            }
            attron(attrs);
            mvaddch(y, boardLeft + cellX(col), value == 0 ? '.' : static_cast<chtype>('0' + value));
            attroff(attrs);
        }
    }
}

void
BoardView::render(const GameSession& session, const std::string& status) const
{
    if (!fitsScreen()) {
        drawTooSmall();
        return;
    }

    erase();
    const auto& puzzle = session.puzzle();
    drawCentered(top(), fmt::format("Sudoku | {} | {} clues", difficultyName(puzzle.difficulty), puzzle.clueCount()));
    drawGrid(session.board(), session.markedErrors(), std::nullopt);
    drawCentered(top() + 3 + boardHeight, status);

    const auto cursor = session.cursor();
    move(top() + 2 + cellY(cursor.row), left() + cellX(cursor.col));
    curs_set(1);
    refresh();
}

void
BoardView::renderSearch(const GameSession& session, const SudokuGrid& grid, const SolveStep& step) const
{
    if (!fitsScreen()) {
        drawTooSmall();
        return;
    }

    erase();
    drawCentered(top(), fmt::format("Sudoku | {} | solving", difficultyName(session.difficulty())));
    drawGrid(grid, {}, step.pos);
    drawCentered(top() + 3 + boardHeight,
                 fmt::format("{} {} at ({}, {})",
                             step.kind == StepKind::Place ? "place" : "retract",
                             step.kind == StepKind::Place ? step.newValue : step.oldValue,
                             step.pos.row + 1,
                             step.pos.col + 1));
    drawCentered(commandLine(), "any key: skip animation, q: stop");
    curs_set(0);
    refresh();
}

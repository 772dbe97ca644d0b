#ifndef SUDOKUTERM_SUDOKU_GRID_H
#define SUDOKUTERM_SUDOKU_GRID_H

#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "sudoku_errors.h"

using cell_t = int;

struct CellPos
{
    size_t row;
    size_t col;

    bool operator<(const CellPos& other) const
    {
        return row < other.row || (row == other.row && col < other.col);
    }

    bool operator==(const CellPos& other) const { return row == other.row && col == other.col; }
    bool operator!=(const CellPos& other) const { return !(*this == other); }
};

std::ostream&
operator<<(std::ostream& output, const CellPos& pos);

/**
 * Square sudoku grid stored in row-major order. Empty cells hold 0. Cells can be marked as fixed, i.e. as clues of
 * the puzzle, after which their value can no longer be changed.
 */
class SudokuGrid
{
    std::vector<cell_t> elements;
    std::vector<bool> fixedCells;

    void checkBounds(size_t row, size_t col) const;

  public:
    const size_t sideLen;
    const size_t boxLen;

    explicit SudokuGrid(size_t side_len = 9);

    SudokuGrid(const SudokuGrid& other) = default;
    SudokuGrid(SudokuGrid&& other) noexcept = default;

    /**
     * Parses a grid from its flat text form. Digits are cell values, '.' and '0' mark empty cells and whitespace is
     * ignored.
     * @throws std::invalid_argument if the number of cells does not match the side length or a character is unknown
     */
    static SudokuGrid fromString(const std::string& text, size_t side_len = 9);

    [[nodiscard]] const cell_t& operator[](size_t idx) const;

    /**
     * @throws OutOfBoundsError if row or col is outside of the grid
     */
    [[nodiscard]] cell_t get(size_t row, size_t col) const;

    /**
     * Writes a value to a cell. 0 clears the cell.
     * @throws OutOfBoundsError if row or col is outside of the grid
     * @throws InvalidDigitError if the value is not in [0, sideLen]
     * @throws CellLockedError if the cell is a fixed clue
     */
    void set(size_t row, size_t col, cell_t value);

    [[nodiscard]] bool isFixed(size_t row, size_t col) const;

    [[nodiscard]] bool isCellFilled(size_t row, size_t col) const;

    /**
     * Marks every non-empty cell as fixed.
     */
    void lockFilledCells();

    /**
     * Empties every cell that is not fixed.
     */
    void clearUnfixed();

    /**
     * Checks whether value could be written to the cell without repeating a digit in its row, column or box. The
     * cell itself is not considered, so a filled cell can be tested against its own value.
     */
    [[nodiscard]] bool isLegalPlacement(size_t row, size_t col, cell_t value) const;

    [[nodiscard]] bool isComplete() const;

    /**
     * Returns all filled cells whose digit appears a second time in their row, column or box.
     */
    [[nodiscard]] std::set<CellPos> findErrors() const;

    [[nodiscard]] size_t filledCount() const;

    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] SudokuGrid clone() const;

    /**
     * Compares cell values only; fixed flags are ignored.
     */
    bool operator==(const SudokuGrid& other) const;
    bool operator!=(const SudokuGrid& other) const;

    static void printGrid(std::ostream& os, const SudokuGrid& grid, bool flat = true);

    friend std::ostream& operator<<(std::ostream& output, const SudokuGrid& grid);
};

#endif // SUDOKUTERM_SUDOKU_GRID_H

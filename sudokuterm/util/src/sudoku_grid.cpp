#include "sudoku_grid.h"

#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

std::ostream&
operator<<(std::ostream& output, const CellPos& pos)
{
    return output << '(' << pos.row << ", " << pos.col << ')';
}

SudokuGrid::SudokuGrid(size_t side_len)
  : elements(side_len * side_len)
  , fixedCells(side_len * side_len, false)
  , sideLen(side_len)
  , boxLen(static_cast<size_t>(std::lround(std::sqrt(static_cast<double>(side_len)))))
{
    // The side length must be a perfect square for a well-defined sudoku
    if (side_len == 0 || boxLen * boxLen != side_len) {
        throw std::invalid_argument(fmt::format("{} is not a valid side length", side_len));
    }
}

SudokuGrid
SudokuGrid::fromString(const std::string& text, size_t side_len)
{
    SudokuGrid grid(side_len);

    size_t idx = 0;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (idx >= grid.size()) {
            throw std::invalid_argument(fmt::format("Too many cells, expected {}.", grid.size()));
        }

        cell_t value;
        if (c == '.' || c == '0') {
            value = 0;
        } else if (c >= '1' && c <= '9') {
            value = c - '0';
        } else {
            throw std::invalid_argument(fmt::format("Unexpected character '{}' in grid.", c));
        }
        if (value > static_cast<cell_t>(side_len)) {
            throw std::invalid_argument(fmt::format("Digit {} exceeds the side length {}.", value, side_len));
        }
        grid.elements[idx++] = value;
    }

    if (idx != grid.size()) {
        throw std::invalid_argument(fmt::format("Got {} cells, expected {}.", idx, grid.size()));
    }
    return grid;
}

void
SudokuGrid::checkBounds(size_t row, size_t col) const
{
    if (row >= sideLen || col >= sideLen) {
        throw OutOfBoundsError(row, col);
    }
}

const cell_t&
SudokuGrid::operator[](size_t idx) const
{
    return elements[idx];
}

cell_t
SudokuGrid::get(size_t row, size_t col) const
{
    checkBounds(row, col);
    return elements[sideLen * row + col];
}

void
SudokuGrid::set(size_t row, size_t col, cell_t value)
{
    checkBounds(row, col);
    if (value < 0 || value > static_cast<cell_t>(sideLen)) {
        throw InvalidDigitError(value);
    }
    const size_t idx = sideLen * row + col;
    if (fixedCells[idx]) {
        throw CellLockedError(row, col);
    }
    elements[idx] = value;
}

bool
SudokuGrid::isFixed(size_t row, size_t col) const
{
    checkBounds(row, col);
    return fixedCells[sideLen * row + col];
}

bool
SudokuGrid::isCellFilled(size_t row, size_t col) const
{
    return get(row, col) > 0;
}

void
SudokuGrid::lockFilledCells()
{
    for (size_t i = 0; i < elements.size(); i++) {
        if (elements[i] != 0) {
            fixedCells[i] = true;
        }
    }
}

void
SudokuGrid::clearUnfixed()
{
    for (size_t i = 0; i < elements.size(); i++) {
        if (!fixedCells[i]) {
            elements[i] = 0;
        }
    }
}

bool
SudokuGrid::isLegalPlacement(size_t row, size_t col, cell_t value) const
{
    checkBounds(row, col);
    if (value < 0 || value > static_cast<cell_t>(sideLen)) {
        throw InvalidDigitError(value);
    }
    if (value == 0) {
        return true;
    }

    // check row and col
    for (size_t i = 0; i < sideLen; i++) {
        if (i != col && elements[sideLen * row + i] == value) {
            return false;
        }
        if (i != row && elements[sideLen * i + col] == value) {
            return false;
        }
    }

    // check box
    const size_t boxRow = (row / boxLen) * boxLen;
    const size_t boxCol = (col / boxLen) * boxLen;
    for (size_t i = boxRow; i < boxRow + boxLen; i++) {
        for (size_t j = boxCol; j < boxCol + boxLen; j++) {
            if ((i != row || j != col) && elements[sideLen * i + j] == value) {
                return false;
            }
        }
    }
    return true;
}

bool
SudokuGrid::isComplete() const
{
    // Without empty cells and duplicates every unit holds each digit exactly once.
    return filledCount() == size() && findErrors().empty();
}

std::set<CellPos>
SudokuGrid::findErrors() const
{
    std::set<CellPos> errors;
    for (size_t row = 0; row < sideLen; row++) {
        for (size_t col = 0; col < sideLen; col++) {
            const cell_t value = elements[sideLen * row + col];
            if (value != 0 && !isLegalPlacement(row, col, value)) {
                errors.insert({ row, col });
            }
        }
    }
    return errors;
}

size_t
SudokuGrid::filledCount() const
{
    size_t count = 0;
    for (const auto value : elements) {
        if (value != 0) {
            count++;
        }
    }
    return count;
}

size_t
SudokuGrid::size() const noexcept
{
    return elements.size();
}

SudokuGrid
SudokuGrid::clone() const
{
    return SudokuGrid(*this);
}

bool
SudokuGrid::operator==(const SudokuGrid& other) const
{
    return sideLen == other.sideLen && elements == other.elements;
}

bool
SudokuGrid::operator!=(const SudokuGrid& other) const
{
    return !(*this == other);
}

void
SudokuGrid::printGrid(std::ostream& os, const SudokuGrid& grid, bool flat)
{
    std::string vblock_div;
    if (!flat) {
        std::stringstream ss;
        for (size_t i = 0; i < grid.boxLen; i++) {
            for (size_t j = 0; j < grid.boxLen; j++) {
                ss << '-';
            }
            if (i != grid.boxLen - 1) {
                ss << '+';
            }
        }
        ss << '\n';
        vblock_div = ss.str();
    }

    for (size_t row = 0; row < grid.sideLen; row++) {
        for (size_t col = 0; col < grid.sideLen; col++) {
            auto val = grid.get(row, col);
            os << (val == 0 ? "." : std::to_string(val));
            if (!flat && (col % grid.boxLen == grid.boxLen - 1)) {
                os << ((col != grid.sideLen - 1) ? '|' : '\n');
            }
        }
        if (!flat && (row != grid.sideLen - 1) && (row % grid.boxLen == grid.boxLen - 1)) {
            os << vblock_div;
        }
    }
}

std::ostream&
operator<<(std::ostream& output, const SudokuGrid& grid)
{
    SudokuGrid::printGrid(output, grid, true);
    return output;
}

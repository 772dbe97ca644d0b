#ifndef SUDOKUTERM_SUDOKU_ERRORS_H
#define SUDOKUTERM_SUDOKU_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

/**
 * Base class of all errors raised by grid operations. These are recoverable: the caller is expected to reject the
 * offending input and continue.
 */
class SudokuError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class OutOfBoundsError : public SudokuError
{
    size_t row_;
    size_t col_;

  public:
    OutOfBoundsError(size_t row, size_t col)
      : SudokuError(fmt::format("cell ({}, {}) is outside of the grid", row, col))
      , row_(row)
      , col_(col)
    {}

    [[nodiscard]] size_t row() const noexcept { return row_; }
    [[nodiscard]] size_t col() const noexcept { return col_; }
};

class InvalidDigitError : public SudokuError
{
    int value_;

  public:
    explicit InvalidDigitError(int value)
      : SudokuError(fmt::format("{} is not a valid digit", value))
      , value_(value)
    {}

    [[nodiscard]] int value() const noexcept { return value_; }
};

class CellLockedError : public SudokuError
{
    size_t row_;
    size_t col_;

  public:
    CellLockedError(size_t row, size_t col)
      : SudokuError(fmt::format("cell ({}, {}) is a fixed clue", row, col))
      , row_(row)
      , col_(col)
    {}

    [[nodiscard]] size_t row() const noexcept { return row_; }
    [[nodiscard]] size_t col() const noexcept { return col_; }
};

#endif // SUDOKUTERM_SUDOKU_ERRORS_H

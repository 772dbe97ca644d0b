#ifndef SUDOKUTERM_SESSION_COMMAND_H
#define SUDOKUTERM_SESSION_COMMAND_H

#include "SudokuGenerator.h"

#include <optional>
#include <string>

enum class CommandType
{
    Quit,
    Check,
    Solve,
    NewGame,
    Reset
};

struct Command
{
    CommandType type;
    /**
     * Only meaningful for NewGame.
     */
    Difficulty difficulty = Difficulty::Medium;
};

/**
 * Parses a line typed into the command bar. A leading ':' and surrounding whitespace are ignored, case does not
 * matter and any prefix of a command name selects it, e.g. "q", ":quit" and "Qu" all quit.
 *
 * Commands: quit, check, solve, easy, medium, hard, reset.
 */
std::optional<Command>
parseCommand(const std::string& line);

#endif // SUDOKUTERM_SESSION_COMMAND_H

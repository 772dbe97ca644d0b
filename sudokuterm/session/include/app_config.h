#ifndef SUDOKUTERM_APP_CONFIG_H
#define SUDOKUTERM_APP_CONFIG_H

#include "SudokuGenerator.h"
#include "cli_opts.h"
#include "log.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct AppConfig
{
    Difficulty difficulty = Difficulty::Medium;
    std::optional<std::uint32_t> seed;
    int stepDelayMs = 5;
    std::string logFile;
    LogLevel logLevel = LogLevel::Info;
    bool printOnly = false;
    bool showHelp = false;
};

extern const char* const usageText;

/**
 * Builds the application configuration from the command line.
 *
 * @throws std::invalid_argument for unknown options, malformed values or more than one positional argument
 */
AppConfig
parseAppConfig(const CliOptionsParser& options);

/**
 * Creates the parser with the value options understood by parseAppConfig().
 */
CliOptionsParser
makeOptionsParser(int argc, char** argv);

CliOptionsParser
makeOptionsParser(std::vector<std::string> args);

#endif // SUDOKUTERM_APP_CONFIG_H

#include "app_config.h"

#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

const char* const usageText = "Usage: sudokuterm [easy|medium|hard] [options]\n"
                              "\n"
                              "Options:\n"
                              "  --seed N            seed for the puzzle generator\n"
                              "  --delay MS          pause between two solver steps (default 5)\n"
                              "  --log FILE          append log messages to FILE\n"
                              "  --log-level LEVEL   debug, info, warn or error (default info)\n"
                              "  --print             print a puzzle and its solution instead of playing\n"
                              "  --help              show this text\n"
                              "\n"
                              "In game: arrow keys move, 1-9 enter a digit, 0 or space clear a cell,\n"
                              "':' opens the command bar (quit, check, solve, easy, medium, hard, reset).\n";

namespace {
const std::vector<std::string> valueOptions{ "--seed", "--delay", "--log", "--log-level" };
const std::vector<std::string> flagOptions{ "--print", "--help" };

long long
parseInteger(const std::string& option, const std::string& value, long long min, long long max)
{
    if (value.empty()) {
        throw std::invalid_argument(fmt::format("Missing value for {}.", option));
    }

    size_t consumed = 0;
    long long number;
    try {
        number = std::stoll(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(fmt::format("Invalid value '{}' for {}.", value, option));
    }
    if (consumed != value.size() || number < min || number > max) {
        throw std::invalid_argument(fmt::format("Invalid value '{}' for {}.", value, option));
    }
    return number;
}
}

CliOptionsParser
makeOptionsParser(int argc, char** argv)
{
    return CliOptionsParser(argc, argv, valueOptions);
}

CliOptionsParser
makeOptionsParser(std::vector<std::string> args)
{
    return CliOptionsParser(std::move(args), valueOptions);
}

AppConfig
parseAppConfig(const CliOptionsParser& options)
{
    AppConfig config;

    const auto unknown = options.getUnknownOptions(flagOptions);
    if (!unknown.empty()) {
        throw std::invalid_argument(fmt::format("Unknown option {}.", unknown.front()));
    }

    config.showHelp = options.hasOption("--help");
    config.printOnly = options.hasOption("--print");

    const auto positional = options.getPositionalOptions();
    if (positional.size() > 1) {
        throw std::invalid_argument(fmt::format("Unexpected argument '{}'.", positional.at(1)));
    }
    if (!positional.empty()) {
        const auto difficulty = parseDifficulty(positional.front());
        if (!difficulty) {
            throw std::invalid_argument(fmt::format("Unknown difficulty '{}'.", positional.front()));
        }
        config.difficulty = *difficulty;
    }

    if (options.hasOption("--seed")) {
        config.seed = static_cast<std::uint32_t>(
          parseInteger("--seed", options.getOption("--seed"), 0, std::numeric_limits<std::uint32_t>::max()));
    }
    if (options.hasOption("--delay")) {
        config.stepDelayMs = static_cast<int>(parseInteger("--delay", options.getOption("--delay"), 0, 10000));
    }
    if (options.hasOption("--log")) {
        config.logFile = options.getOption("--log");
        if (config.logFile.empty()) {
            throw std::invalid_argument("Missing value for --log.");
        }
    }
    if (options.hasOption("--log-level")) {
        config.logLevel = parseLogLevel(options.getOption("--log-level"));
    }

    return config;
}

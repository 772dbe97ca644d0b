#include "session_command.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {
const std::array<std::pair<const char*, Command>, 7> commands{ {
  { "quit", { CommandType::Quit } },
  { "check", { CommandType::Check } },
  { "solve", { CommandType::Solve } },
  { "easy", { CommandType::NewGame, Difficulty::Easy } },
  { "medium", { CommandType::NewGame, Difficulty::Medium } },
  { "hard", { CommandType::NewGame, Difficulty::Hard } },
  { "reset", { CommandType::Reset } },
} };

std::string
normalize(const std::string& line)
{
    auto begin = std::find_if_not(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(line.rbegin(), line.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) {
        return {};
    }

    std::string word(begin, end);
    if (word.front() == ':') {
        word.erase(0, 1);
    }
    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return std::tolower(c); });
    return word;
}
}

std::optional<Command>
parseCommand(const std::string& line)
{
    const std::string word = normalize(line);
    if (word.empty()) {
        return std::nullopt;
    }

    for (const auto& [name, command] : commands) {
        if (std::string(name).rfind(word, 0) == 0) {
            return command;
        }
    }
    return std::nullopt;
}

#include "log.h"

#include <ctime>
#include <stdexcept>

#include <fmt/chrono.h>

namespace {
std::FILE* logSink = nullptr;
std::FILE* ownedLogFile = nullptr;
LogLevel minLevel = LogLevel::Info;
}

LogLevel
parseLogLevel(const std::string& name)
{
    if (name == "debug") {
        return LogLevel::Debug;
    } else if (name == "info") {
        return LogLevel::Info;
    } else if (name == "warn") {
        return LogLevel::Warn;
    } else if (name == "error") {
        return LogLevel::Error;
    }
    throw std::invalid_argument(fmt::format("Unknown log level '{}'.", name));
}

const char*
logLevelName(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return "D";
        case LogLevel::Info:
            return "I";
        case LogLevel::Warn:
            return "W";
        case LogLevel::Error:
            return "E";
    }
    return "?";
}

void
setLogSink(std::FILE* sink)
{
    logSink = sink;
}

void
openLogFile(const std::string& path)
{
    std::FILE* file = std::fopen(path.c_str(), "a");
    if (file == nullptr) {
        throw std::runtime_error(fmt::format("Could not open log file '{}'.", path));
    }
    closeLogFile();
    ownedLogFile = file;
    logSink = file;
}

void
closeLogFile()
{
    if (ownedLogFile != nullptr) {
        if (logSink == ownedLogFile) {
            logSink = nullptr;
        }
        std::fclose(ownedLogFile);
        ownedLogFile = nullptr;
    }
}

void
setLogLevel(LogLevel level)
{
    minLevel = level;
}

bool
isLogEnabled(LogLevel level)
{
    return logSink != nullptr && level >= minLevel;
}

void
writeLog(LogLevel level, std::string_view message)
{
    if (logSink == nullptr) {
        return;
    }
    const std::time_t now = std::time(nullptr);
    fmt::print(logSink, "{:%Y-%m-%d %H:%M:%S} {} {}\n", fmt::localtime(now), logLevelName(level), message);
    std::fflush(logSink);
}

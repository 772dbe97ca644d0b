#ifndef SUDOKUTERM_LOG_H
#define SUDOKUTERM_LOG_H

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

/**
 * Parses "debug", "info", "warn" or "error".
 * @throws std::invalid_argument for any other name
 */
LogLevel
parseLogLevel(const std::string& name);

const char*
logLevelName(LogLevel level);

/**
 * Sets the stream log lines are written to. nullptr disables logging. The stream is not owned.
 */
void
setLogSink(std::FILE* sink);

/**
 * Opens the given file in append mode and uses it as log sink until closeLogFile() is called.
 * @throws std::runtime_error if the file cannot be opened
 */
void
openLogFile(const std::string& path);

void
closeLogFile();

void
setLogLevel(LogLevel level);

bool
isLogEnabled(LogLevel level);

void
writeLog(LogLevel level, std::string_view message);

template<typename... Args>
void
logMessage(LogLevel level, fmt::format_string<Args...> format, Args&&... args)
{
    if (isLogEnabled(level)) {
        writeLog(level, fmt::format(format, std::forward<Args>(args)...));
    }
}

#define LOGD(...) logMessage(LogLevel::Debug, __VA_ARGS__)
#define LOGI(...) logMessage(LogLevel::Info, __VA_ARGS__)
#define LOGW(...) logMessage(LogLevel::Warn, __VA_ARGS__)
#define LOGE(...) logMessage(LogLevel::Error, __VA_ARGS__)

#endif // SUDOKUTERM_LOG_H

/**
 * @file Logger.hpp
 * @brief Component-tagged diagnostic output with a process-wide verbosity threshold.
 */

#pragma once

#include <string>

namespace chatvault::infrastructure {

/**
 * @enum LogVerbosity
 * @brief Amount of diagnostic output.
 */
enum class LogVerbosity {
    ProblemsOnly, ///< Warnings and errors.
    Normal,       ///< Adds progress information.
    Verbose       ///< Adds debug lines with timestamps.
};

/**
 * @class Logger
 * @brief Writes "[Component] message" lines to stderr.
 */
class Logger {
public:
    static void SetVerbosity(LogVerbosity verbosity);

    static void Debug(const std::string& component, const std::string& message);
    static void Info(const std::string& component, const std::string& message);
    static void Warning(const std::string& component, const std::string& message);
    static void Error(const std::string& component, const std::string& message);

private:
    static void Write(const char* level, const std::string& component, const std::string& message);
};

} // namespace chatvault::infrastructure

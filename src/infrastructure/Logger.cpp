/**
 * @file Logger.cpp
 * @brief Implementation of Logger.
 */

#include "infrastructure/Logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace chatvault::infrastructure {

namespace {

std::atomic<LogVerbosity> g_verbosity{LogVerbosity::Normal};
std::mutex g_outputMutex;

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

void Logger::SetVerbosity(LogVerbosity verbosity) {
    g_verbosity = verbosity;
}

void Logger::Debug(const std::string& component, const std::string& message) {
    if (g_verbosity.load() != LogVerbosity::Verbose) return;
    Write("DEBUG", component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
    if (g_verbosity.load() == LogVerbosity::ProblemsOnly) return;
    Write(nullptr, component, message);
}

void Logger::Warning(const std::string& component, const std::string& message) {
    Write("WARNING", component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
    Write("ERROR", component, message);
}

void Logger::Write(const char* level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_outputMutex);
    if (g_verbosity.load() == LogVerbosity::Verbose) {
        std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
        char buf[32];
        std::strftime(buf, sizeof(buf), "%H:%M:%S ", &tm);
        std::cerr << buf;
    }
    std::cerr << "[" << component << "] ";
    if (level) {
        std::cerr << level << ": ";
    }
    std::cerr << message << std::endl;
}

} // namespace chatvault::infrastructure

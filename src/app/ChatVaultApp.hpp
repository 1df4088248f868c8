/**
 * @file ChatVaultApp.hpp
 * @brief Command line front end of ChatVault.
 */

#pragma once

#include <filesystem>
#include <optional>
#include "application/CancellationToken.hpp"

namespace chatvault::app {

/**
 * @class ChatVaultApp
 * @brief Parses the command line, loads the configuration and executes one archiving run.
 *
 * Exit codes: 0 success, 1 when a channel failed, 2 on configuration or authentication
 * failure, 130 when interrupted by SIGINT/SIGTERM.
 */
class ChatVaultApp {
public:
    static constexpr int ExitOk = 0;
    static constexpr int ExitChannelFailure = 1;
    static constexpr int ExitFatal = 2;
    static constexpr int ExitInterrupted = 130;

    /**
     * @brief Runs the application.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Reads --conf, --verbose and --help.
     * @return Exit code when the process must end right away.
     */
    std::optional<int> ParseArguments(int argc, char** argv);

    void InstallSignalHandlers();
    static void PrintUsage(const char* program);

    application::CancellationToken m_cancel;
    std::optional<std::filesystem::path> m_configPath;
    bool m_verbose = false;
};

} // namespace chatvault::app

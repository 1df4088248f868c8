/**
 * @file ChatVaultApp.cpp
 * @brief Implementation of the ChatVaultApp class.
 */
#include "app/ChatVaultApp.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

#include "application/ArchiveRunService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/MattermostAdapter.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace chatvault::app {

using infrastructure::Logger;

namespace {

application::CancellationToken* g_cancel = nullptr;

extern "C" void OnStopSignal(int) {
    if (g_cancel) {
        g_cancel->requestStop();
    }
}

} // namespace

void ChatVaultApp::PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--conf <file>] [--verbose]\n"
              << "\n"
              << "Archives Mattermost channel history into local JSON files.\n"
              << "\n"
              << "  -c, --conf <file>  Configuration file (default: ./chatvault.json,\n"
              << "                     $XDG_CONFIG_HOME/chatvault.json, ~/.config/chatvault.json)\n"
              << "  -v, --verbose      Print debug output\n"
              << "  -h, --help         Show this help\n";
}

std::optional<int> ChatVaultApp::ParseArguments(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return ExitOk;
        } else if (arg == "-v" || arg == "--verbose") {
            m_verbose = true;
        } else if (arg == "-c" || arg == "--conf") {
            if (i + 1 >= argc) {
                std::cerr << "Option " << arg << " needs a file name\n";
                return ExitFatal;
            }
            m_configPath = argv[++i];
        } else if (arg.rfind("--conf=", 0) == 0) {
            m_configPath = arg.substr(std::strlen("--conf="));
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            return ExitFatal;
        }
    }
    return std::nullopt;
}

void ChatVaultApp::InstallSignalHandlers() {
    g_cancel = &m_cancel;
    std::signal(SIGINT, OnStopSignal);
    std::signal(SIGTERM, OnStopSignal);
}

int ChatVaultApp::Run(int argc, char** argv) {
    if (auto exitCode = ParseArguments(argc, argv)) {
        return *exitCode;
    }

    infrastructure::AppConfig config;
    try {
        if (!m_configPath) {
            m_configPath = infrastructure::ConfigLoader::DiscoverConfigFile();
            if (!m_configPath) {
                throw domain::ConfigurationError("No configuration file found, use --conf <file>");
            }
        }
        config = infrastructure::ConfigLoader::LoadFile(*m_configPath);
    } catch (const domain::ConfigurationError& e) {
        Logger::Error("ChatVault", e.what());
        return ExitFatal;
    }

    Logger::SetVerbosity(m_verbose ? infrastructure::LogVerbosity::Verbose : config.verbosity);
    Logger::Debug("ChatVault", "Using configuration " + m_configPath->string());

    InstallSignalHandlers();

    infrastructure::MattermostAdapter remote(config.connection.hostname,
                                             config.connection.username,
                                             config.connection.password,
                                             config.connection.token,
                                             config.throttling.loopDelay);
    infrastructure::PersistenceService persistence;
    application::ArchiveRunService service(config, remote, remote, persistence, m_cancel);

    application::RunReport report;
    try {
        report = service.run();
    } catch (const domain::AuthFailure& e) {
        Logger::Error("ChatVault", std::string("Authentication failed: ") + e.what());
        return ExitFatal;
    } catch (const domain::TransportFailure& e) {
        Logger::Error("ChatVault", std::string("Server unreachable: ") + e.what());
        return ExitChannelFailure;
    } catch (const domain::RemoteRequestError& e) {
        Logger::Error("ChatVault", std::string("Server refused the request: ") + e.what());
        return ExitChannelFailure;
    }

    if (report.interrupted || m_cancel.stopRequested()) {
        Logger::Warning("ChatVault", "Interrupted");
        return ExitInterrupted;
    }
    return report.failedChannels > 0 ? ExitChannelFailure : ExitOk;
}

} // namespace chatvault::app

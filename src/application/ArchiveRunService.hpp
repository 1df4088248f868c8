/**
 * @file ArchiveRunService.hpp
 * @brief One complete archiving run over every selected channel.
 */

#pragma once

#include <cstddef>
#include <vector>
#include "application/CancellationToken.hpp"
#include "application/FetchPlanner.hpp"
#include "domain/RemoteDirectory.hpp"
#include "domain/RemoteFetchPort.hpp"
#include "domain/SyncTypes.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace chatvault::application {

/**
 * @struct RunReport
 * @brief Outcome of a run, one summary per channel that was started.
 */
struct RunReport {
    std::vector<domain::ChannelSummary> channels;
    std::size_t failedChannels = 0;
    bool interrupted = false;
};

/**
 * @class ArchiveRunService
 * @brief Logs in, selects channels and synchronizes them one after another.
 */
class ArchiveRunService {
public:
    ArchiveRunService(const infrastructure::AppConfig& config,
                      domain::RemoteFetchPort& fetch,
                      domain::RemoteDirectory& directory,
                      infrastructure::PersistenceService& persistence,
                      const CancellationToken& cancel,
                      FetchPlanner::Sleeper sleeper = nullptr);

    /**
     * @brief Executes the run.
     * @throws domain::AuthFailure when credentials are rejected.
     * @throws domain::TransportFailure, domain::RemoteRequestError when login or channel listing fails.
     */
    RunReport run();

private:
    const infrastructure::AppConfig& m_config;
    domain::RemoteFetchPort& m_fetch;
    domain::RemoteDirectory& m_directory;
    infrastructure::PersistenceService& m_persistence;
    const CancellationToken& m_cancel;
    FetchPlanner::Sleeper m_sleeper;
};

} // namespace chatvault::application

/**
 * @file ChannelSyncService.hpp
 * @brief Runs one channel through resolution, fetching, merging and asset download.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "application/AssetDownloader.hpp"
#include "application/CancellationToken.hpp"
#include "application/FetchPlanner.hpp"
#include "domain/ArchiveHeader.hpp"
#include "domain/ChannelOptions.hpp"
#include "domain/Entities.hpp"
#include "domain/RemoteFetchPort.hpp"
#include "domain/SyncTypes.hpp"
#include "infrastructure/ArchiveStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace chatvault::application {

/**
 * @struct ChannelJob
 * @brief One channel selected for download.
 */
struct ChannelJob {
    std::string archiveName;
    domain::Channel channel;
    std::optional<domain::Team> team;
    std::vector<domain::User> seedUsers; ///< Users recorded in the header even without posts.
    domain::ChannelOptions options;
};

/**
 * @struct SyncSettings
 * @brief Run-wide settings shared by all channels.
 */
struct SyncSettings {
    std::filesystem::path outputDirectory = ".";
    PlannerSettings planner;
    bool humanFriendlyPosts = false;
};

/**
 * @class ChannelSyncService
 * @brief Single-writer pipeline for one archive.
 *
 * Holds the archive lock for the whole run. Problems local to the channel end up in
 * ChannelSummary::error; domain::AuthFailure is rethrown because it ends the whole run.
 */
class ChannelSyncService {
public:
    ChannelSyncService(domain::RemoteFetchPort& remote,
                       infrastructure::PersistenceService& persistence,
                       SyncSettings settings,
                       const CancellationToken& cancel,
                       AssetDownloader* assets = nullptr,
                       FetchPlanner::Sleeper sleeper = nullptr);

    domain::ChannelSummary run(const ChannelJob& job);

private:
    void synchronize(const ChannelJob& job, infrastructure::ArchiveStore& store, domain::ChannelSummary& summary);
    std::optional<domain::ArchiveHeader> openArchive(infrastructure::ArchiveStore& store,
                                                     const domain::ChannelOptions& options);

    domain::RemoteFetchPort& m_remote;
    infrastructure::PersistenceService& m_persistence;
    SyncSettings m_settings;
    const CancellationToken& m_cancel;
    AssetDownloader* m_assets;
    FetchPlanner::Sleeper m_sleeper;
};

} // namespace chatvault::application

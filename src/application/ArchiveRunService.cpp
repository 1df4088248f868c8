/**
 * @file ArchiveRunService.cpp
 * @brief Implementation of ArchiveRunService.
 */

#include "application/ArchiveRunService.hpp"
#include "application/AssetDownloader.hpp"
#include "application/ChannelSelector.hpp"
#include "application/ChannelSyncService.hpp"
#include "domain/Errors.hpp"
#include "domain/Time.hpp"
#include "infrastructure/Logger.hpp"

#include <sstream>

namespace chatvault::application {

using infrastructure::Logger;

namespace {

std::string Describe(const domain::ChannelSummary& summary) {
    std::ostringstream ss;
    ss << summary.archiveName << ": " << domain::CompatibilityActionToString(summary.action);
    if (summary.stopReason) {
        ss << ", " << summary.postsWritten << " posts written";
        if (summary.postsMalformed > 0) ss << ", " << summary.postsMalformed << " malformed";
        ss << ", stopped by " << domain::StopReasonToString(*summary.stopReason);
    }
    if (summary.storage) {
        const domain::StorageInfo& storage = *summary.storage;
        ss << ", " << storage.count << " stored (" << domain::OrderingToString(storage.organization) << ")";
        if (storage.beginTime && storage.endTime) {
            ss << " " << domain::FormatIsoTime(*storage.beginTime) << " .. " << domain::FormatIsoTime(*storage.endTime);
        }
    }
    if (summary.error) {
        ss << ", failed: " << *summary.error;
    }
    return ss.str();
}

} // namespace

ArchiveRunService::ArchiveRunService(const infrastructure::AppConfig& config,
                                     domain::RemoteFetchPort& fetch,
                                     domain::RemoteDirectory& directory,
                                     infrastructure::PersistenceService& persistence,
                                     const CancellationToken& cancel,
                                     FetchPlanner::Sleeper sleeper)
    : m_config(config),
      m_fetch(fetch),
      m_directory(directory),
      m_persistence(persistence),
      m_cancel(cancel),
      m_sleeper(std::move(sleeper)) {}

RunReport ArchiveRunService::run() {
    RunReport report;

    Logger::Info("ArchiveRun", "Logging in to " + m_config.connection.hostname);
    const domain::User me = m_directory.login();
    Logger::Info("ArchiveRun", "Logged in as " + me.name);

    AssetDownloader assets(m_directory, m_persistence, m_config.outputDirectory, m_cancel);
    if (m_config.downloadAllEmojis) {
        try {
            assets.downloadEmojiDatabase();
        } catch (const domain::TransportFailure& e) {
            Logger::Warning("ArchiveRun", std::string("Emoji database not downloaded: ") + e.what());
        } catch (const domain::RemoteRequestError& e) {
            Logger::Warning("ArchiveRun", std::string("Emoji database not downloaded: ") + e.what());
        }
    }

    Logger::Info("ArchiveRun", "Selecting channels");
    ChannelSelector selector(m_directory, m_config);
    const std::vector<ChannelJob> jobs = selector.select(me);

    SyncSettings settings;
    settings.outputDirectory = m_config.outputDirectory;
    settings.planner.batchSize = m_config.batchSize;
    settings.planner.retryLimit = m_config.throttling.retryCount;
    settings.planner.retryDelay = m_config.throttling.retryDelay;
    settings.planner.loopDelay = m_config.throttling.loopDelay;
    settings.humanFriendlyPosts = m_config.humanFriendlyPosts;
    ChannelSyncService sync(m_fetch, m_persistence, settings, m_cancel, &assets, m_sleeper);

    std::size_t written = 0;
    for (const auto& job : jobs) {
        if (m_cancel.stopRequested()) {
            report.interrupted = true;
            break;
        }
        Logger::Info("ArchiveRun", "Processing " + job.archiveName);
        domain::ChannelSummary summary = sync.run(job);
        if (summary.error) ++report.failedChannels;
        if (summary.stopReason == domain::StopReason::Interrupted) report.interrupted = true;
        written += summary.postsWritten;

        if (summary.error) {
            Logger::Warning("ArchiveRun", Describe(summary));
        } else {
            Logger::Info("ArchiveRun", Describe(summary));
        }
        report.channels.push_back(std::move(summary));
    }

    std::ostringstream total;
    total << "Processed " << report.channels.size() << " of " << jobs.size() << " channels, " << written
          << " posts written, " << report.failedChannels << " failed";
    if (report.interrupted) total << ", interrupted";
    Logger::Info("ArchiveRun", total.str());
    return report;
}

} // namespace chatvault::application

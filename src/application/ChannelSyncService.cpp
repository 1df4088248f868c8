/**
 * @file ChannelSyncService.cpp
 * @brief Implementation of ChannelSyncService.
 */

#include "application/ChannelSyncService.hpp"
#include "application/ArchiveMerger.hpp"
#include "application/CompatibilityResolver.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"

#include <system_error>

namespace chatvault::application {

namespace fs = std::filesystem;
using domain::CompatibilityAction;
using infrastructure::ArchiveStore;
using infrastructure::Logger;
using infrastructure::RebuildMode;

namespace {

RebuildMode RebuildModeFor(CompatibilityAction action) {
    switch (action) {
        case CompatibilityAction::RebuildWithBackup: return RebuildMode::Backup;
        case CompatibilityAction::RebuildWithDelete: return RebuildMode::Discard;
        default: return RebuildMode::None;
    }
}

} // namespace

ChannelSyncService::ChannelSyncService(domain::RemoteFetchPort& remote,
                                       infrastructure::PersistenceService& persistence,
                                       SyncSettings settings,
                                       const CancellationToken& cancel,
                                       AssetDownloader* assets,
                                       FetchPlanner::Sleeper sleeper)
    : m_remote(remote),
      m_persistence(persistence),
      m_settings(std::move(settings)),
      m_cancel(cancel),
      m_assets(assets),
      m_sleeper(std::move(sleeper)) {}

domain::ChannelSummary ChannelSyncService::run(const ChannelJob& job) {
    domain::ChannelSummary summary;
    summary.archiveName = job.archiveName;

    ArchiveStore store(m_settings.outputDirectory, job.archiveName, m_persistence);
    try {
        std::error_code ec;
        fs::create_directories(m_settings.outputDirectory, ec);
        if (ec) {
            throw domain::ArchiveError("Cannot create output directory " + m_settings.outputDirectory.string() +
                                       ": " + ec.message());
        }
        store.lock();
        synchronize(job, store, summary);
    } catch (const domain::ArchiveError& e) {
        summary.error = e.what();
    } catch (const domain::RemoteRequestError& e) {
        summary.error = e.what();
    } catch (const domain::TransportFailure& e) {
        summary.error = e.what();
    } catch (const domain::MalformedRecordError& e) {
        summary.error = e.what();
    }
    store.close();

    if (summary.error) {
        Logger::Error("ChannelSync", job.archiveName + ": " + *summary.error);
    }
    return summary;
}

std::optional<domain::ArchiveHeader> ChannelSyncService::openArchive(ArchiveStore& store,
                                                                     const domain::ChannelOptions& options) {
    try {
        return store.open();
    } catch (const domain::DesynchronizedError& e) {
        const auto actual = e.actualSize();
        if (!options.repairUncommitted || !actual || *actual <= e.expectedSize()) {
            throw;
        }
        store.truncateUncommitted(e.expectedSize());
        return store.open();
    }
}

void ChannelSyncService::synchronize(const ChannelJob& job, ArchiveStore& store, domain::ChannelSummary& summary) {
    const domain::ChannelOptions& options = job.options;
    CompatibilityResolver resolver([this](const std::string& postId) -> std::optional<domain::Timestamp> {
        auto post = m_remote.fetchPost(postId);
        if (!post) return std::nullopt;
        return post->createTime;
    });

    std::optional<domain::ArchiveHeader> existing;
    Resolution resolution;
    try {
        existing = openArchive(store, options);
        resolution = resolver.resolve(existing, options, job.channel);
    } catch (const domain::DesynchronizedError& e) {
        Logger::Warning("ChannelSync", e.what());
        existing.reset();
        resolution = resolver.resolveUnusable(options, e.what());
    } catch (const domain::CorruptHeaderError& e) {
        Logger::Warning("ChannelSync", e.what());
        existing.reset();
        resolution = resolver.resolveUnusable(options, e.what());
    }

    summary.action = resolution.action;
    summary.reason = resolution.reason;
    Logger::Info("ChannelSync", job.archiveName + ": " + domain::CompatibilityActionToString(resolution.action) +
                                    " (" + resolution.reason + ")");
    if (resolution.action == CompatibilityAction::Skip) {
        if (existing) summary.storage = existing->storage;
        return;
    }

    const bool appending = resolution.action == CompatibilityAction::Append;
    domain::ArchiveHeader header;
    if (appending) {
        header = *existing;
    }
    header.channel = job.channel;
    header.team = job.team;
    for (const auto& user : job.seedUsers) {
        header.addUser(user);
    }
    const std::int64_t existingCount = appending ? header.storage.count : 0;

    MergeSettings mergeSettings;
    mergeSettings.direction = resolution.bounds.direction;
    mergeSettings.afterTime = resolution.bounds.afterTime;
    mergeSettings.beforeTime = resolution.bounds.beforeTime;
    mergeSettings.keepEmojis = options.emojiMetadata || options.downloadEmoji;
    mergeSettings.humanFriendly = m_settings.humanFriendlyPosts;

    ArchiveMerger merger(store, m_remote, std::move(header), RebuildModeFor(resolution.action), appending,
                         mergeSettings);
    FetchPlanner planner(m_remote, job.channel.id, resolution.bounds, options.maximumPostCount,
                         options.sessionPostLimit, existingCount, m_settings.planner, m_cancel, m_sleeper);

    auto collect = [&]() {
        summary.postsWritten = merger.postsWritten();
        summary.postsSkipped = planner.postsSkipped();
        summary.postsMalformed = planner.postsMalformed();
        if (merger.onDisk()) summary.storage = merger.header().storage;
    };

    try {
        while (auto batch = planner.next()) {
            merger.consume(std::move(*batch));
        }
    } catch (const domain::ArchiveError&) {
        collect();
        throw;
    }

    const domain::StopReason reason = planner.stopReason().value_or(domain::StopReason::NoMorePosts);
    summary.stopReason = reason;
    merger.finish(reason);
    collect();
    if (reason == domain::StopReason::ConnectionTimeout) {
        summary.error = "connection timed out after " + std::to_string(m_settings.planner.retryLimit) + " retries";
    }

    if (m_assets && merger.onDisk() && !m_cancel.stopRequested()) {
        if (m_assets->downloadForArchive(job.archiveName, merger.writtenPosts(), merger.header(), options)) {
            store.rewriteHeader(merger.header());
            summary.storage = merger.header().storage;
        }
    }
}

} // namespace chatvault::application

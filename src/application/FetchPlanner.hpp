/**
 * @file FetchPlanner.hpp
 * @brief Pagination state machine turning a resolved request into post batches.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "application/CancellationToken.hpp"
#include "domain/ChannelOptions.hpp"
#include "domain/RemoteFetchPort.hpp"
#include "domain/SyncTypes.hpp"

namespace chatvault::application {

/**
 * @struct PlannerSettings
 * @brief Transport pacing shared by every channel of a run.
 */
struct PlannerSettings {
    int batchSize = 60;
    int retryLimit = 3;                           ///< Extra attempts after a TransportFailure.
    std::chrono::milliseconds retryDelay{5000};
    std::chrono::milliseconds loopDelay{0};       ///< Pause after every fetch.
};

/**
 * @class FetchPlanner
 * @brief Pulls pages from the remote and yields the accepted posts of each page as one batch.
 *
 * Usage: call next() until it returns std::nullopt, then read stopReason().
 * Cancellation is observed only between pages, so every yielded batch is complete.
 */
class FetchPlanner {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param remote Source of pages.
     * @param channelId Channel to read.
     * @param bounds Effective bounds (after compatibility resolution).
     * @param maximumPostCount Archive-wide limit, domain::kUnlimited for none.
     * @param sessionPostLimit Limit for this run, domain::kUnlimited for none.
     * @param existingCount Posts already stored in the archive being extended.
     * @param settings Batch size, retry and throttling parameters.
     * @param cancel Stop request, checked between pages.
     * @param sleeper Waits for throttling and retry delays; defaults to std::this_thread::sleep_for.
     */
    FetchPlanner(domain::RemoteFetchPort& remote,
                 std::string channelId,
                 domain::FetchBounds bounds,
                 std::int64_t maximumPostCount,
                 std::int64_t sessionPostLimit,
                 std::int64_t existingCount,
                 PlannerSettings settings,
                 const CancellationToken& cancel,
                 Sleeper sleeper = nullptr);

    /** @brief Next non-empty batch, std::nullopt once fetching has stopped. */
    std::optional<domain::PostBatch> next();

    /** @brief Set once next() has returned std::nullopt. */
    std::optional<domain::StopReason> stopReason() const { return m_stopReason; }

    std::size_t postsAccepted() const { return m_accepted; }
    std::size_t postsSkipped() const { return m_skipped; }
    std::size_t postsMalformed() const { return m_malformed; }

private:
    enum class Verdict { Accept, Skip, Stop };

    void initialize();
    Verdict classify(const domain::Post& post) const;
    std::optional<domain::PostPage> fetchWithRetry(const std::optional<std::string>& cursor, domain::OrderDirection direction);
    std::optional<domain::PostPage> walkToOldest();
    void stop(domain::StopReason reason);
    void throttle();

    domain::RemoteFetchPort& m_remote;
    std::string m_channelId;
    domain::FetchBounds m_bounds;
    PlannerSettings m_settings;
    const CancellationToken& m_cancel;
    Sleeper m_sleeper;

    std::optional<std::int64_t> m_sessionRemaining;
    std::optional<std::int64_t> m_totalRemaining;

    bool m_initialized = false;
    std::optional<std::string> m_cursor;
    std::optional<std::string> m_lastConsumed;
    bool m_recordsLost = false;                    ///< Records dropped since the last yielded batch.
    std::optional<domain::PostPage> m_pendingPage; ///< Page already fetched by walkToOldest().
    std::optional<domain::StopReason> m_stopReason;

    std::size_t m_accepted = 0;
    std::size_t m_skipped = 0;
    std::size_t m_malformed = 0;
};

} // namespace chatvault::application

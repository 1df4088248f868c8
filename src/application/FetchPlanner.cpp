/**
 * @file FetchPlanner.cpp
 * @brief Implementation of FetchPlanner.
 */

#include "application/FetchPlanner.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"

#include <algorithm>
#include <thread>

namespace chatvault::application {

using domain::OrderDirection;
using domain::StopReason;
using infrastructure::Logger;

FetchPlanner::FetchPlanner(domain::RemoteFetchPort& remote,
                           std::string channelId,
                           domain::FetchBounds bounds,
                           std::int64_t maximumPostCount,
                           std::int64_t sessionPostLimit,
                           std::int64_t existingCount,
                           PlannerSettings settings,
                           const CancellationToken& cancel,
                           Sleeper sleeper)
    : m_remote(remote),
      m_channelId(std::move(channelId)),
      m_bounds(std::move(bounds)),
      m_settings(settings),
      m_cancel(cancel),
      m_sleeper(std::move(sleeper)) {
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
    if (sessionPostLimit != domain::kUnlimited) {
        m_sessionRemaining = sessionPostLimit;
    }
    if (maximumPostCount != domain::kUnlimited) {
        m_totalRemaining = maximumPostCount - existingCount;
    }
}

void FetchPlanner::stop(StopReason reason) {
    if (!m_stopReason) {
        m_stopReason = reason;
        Logger::Debug("FetchPlanner", "Channel " + m_channelId + " stopped: " + domain::StopReasonToString(reason));
    }
}

void FetchPlanner::throttle() {
    if (m_settings.loopDelay.count() > 0) {
        m_sleeper(m_settings.loopDelay);
    }
}

void FetchPlanner::initialize() {
    m_initialized = true;

    if (m_totalRemaining && *m_totalRemaining <= 0) {
        stop(StopReason::TotalLimitHit);
        return;
    }
    if (m_sessionRemaining && *m_sessionRemaining <= 0) {
        stop(StopReason::SessionLimitHit);
        return;
    }
    if (m_bounds.afterTime && m_bounds.beforeTime && *m_bounds.afterTime >= *m_bounds.beforeTime) {
        stop(StopReason::ConditionHit);
        return;
    }

    m_cursor = m_bounds.direction == OrderDirection::Asc ? m_bounds.afterPost : m_bounds.beforePost;
    m_lastConsumed = m_cursor;

    if (m_bounds.direction == OrderDirection::Asc && !m_cursor && !m_remote.supportsReverseCursor()) {
        m_pendingPage = walkToOldest();
    }
}

std::optional<domain::PostPage> FetchPlanner::fetchWithRetry(const std::optional<std::string>& cursor,
                                                             OrderDirection direction) {
    for (int attempt = 0;; ++attempt) {
        try {
            domain::PostPage page = m_remote.fetchPosts(m_channelId, cursor, direction, m_settings.batchSize);
            throttle();
            return page;
        } catch (const domain::TransportFailure& e) {
            throttle();
            if (attempt >= m_settings.retryLimit) {
                Logger::Error("FetchPlanner", std::string("Giving up on channel ") + m_channelId + ": " + e.what());
                stop(StopReason::ConnectionTimeout);
                return std::nullopt;
            }
            Logger::Warning("FetchPlanner", std::string(e.what()) + ", retrying (" + std::to_string(attempt + 1) +
                                                "/" + std::to_string(m_settings.retryLimit) + ")");
            m_sleeper(m_settings.retryDelay);
            if (m_cancel.stopRequested()) {
                stop(StopReason::Interrupted);
                return std::nullopt;
            }
        }
    }
}

std::optional<domain::PostPage> FetchPlanner::walkToOldest() {
    Logger::Debug("FetchPlanner", "Walking channel " + m_channelId + " back to its oldest post");

    std::optional<domain::PostPage> last;
    std::optional<std::string> cursor;
    std::size_t pages = 0;
    while (true) {
        if (m_cancel.stopRequested()) {
            stop(StopReason::Interrupted);
            return std::nullopt;
        }
        auto page = fetchWithRetry(cursor, OrderDirection::Desc);
        if (!page) {
            return std::nullopt;
        }
        ++pages;
        if (!page->lastRecordId) {
            if (!last) last = std::move(page);
            break;
        }
        const bool reachedStart = page->exhausted;
        // Nothing older than afterTime will be accepted.
        const bool reachedAfterTime = m_bounds.afterTime && !page->posts.empty() &&
                                      page->posts.back().createTime <= *m_bounds.afterTime;
        cursor = page->lastRecordId;
        last = std::move(page);
        if (reachedStart || reachedAfterTime) {
            break;
        }
    }
    Logger::Debug("FetchPlanner", "Walk took " + std::to_string(pages) + " pages");

    domain::PostPage ascending;
    ascending.posts.assign(last->posts.rbegin(), last->posts.rend());
    ascending.precedingPostId = last->followingPostId;
    ascending.followingPostId = last->precedingPostId;
    // The newest record of the walked page is the ascending cursor, even when it was malformed.
    ascending.firstRecordId = last->lastRecordId;
    ascending.lastRecordId = last->firstRecordId;
    ascending.exhausted = !ascending.followingPostId;
    ascending.malformedCount = last->malformedCount;
    return ascending;
}

FetchPlanner::Verdict FetchPlanner::classify(const domain::Post& post) const {
    const auto& b = m_bounds;
    if (b.direction == OrderDirection::Asc) {
        if ((b.beforeTime && post.createTime >= *b.beforeTime) || (b.beforePost && post.id == *b.beforePost)) {
            return Verdict::Stop;
        }
        if ((b.afterTime && post.createTime <= *b.afterTime) || (b.afterPost && post.id == *b.afterPost)) {
            return Verdict::Skip;
        }
    } else {
        if ((b.afterTime && post.createTime <= *b.afterTime) || (b.afterPost && post.id == *b.afterPost)) {
            return Verdict::Stop;
        }
        if ((b.beforeTime && post.createTime >= *b.beforeTime) || (b.beforePost && post.id == *b.beforePost)) {
            return Verdict::Skip;
        }
    }
    return Verdict::Accept;
}

std::optional<domain::PostBatch> FetchPlanner::next() {
    if (m_stopReason) {
        return std::nullopt;
    }
    if (!m_initialized) {
        initialize();
        if (m_stopReason) return std::nullopt;
    }

    while (true) {
        if (m_cancel.stopRequested()) {
            stop(StopReason::Interrupted);
            return std::nullopt;
        }

        std::optional<domain::PostPage> page;
        if (m_pendingPage) {
            page = std::move(m_pendingPage);
            m_pendingPage.reset();
        } else {
            page = fetchWithRetry(m_cursor, m_bounds.direction);
            if (!page) return std::nullopt;
        }

        m_malformed += page->malformedCount;
        if (page->malformedCount > 0) {
            m_recordsLost = true;
        }
        if (!m_lastConsumed) {
            m_lastConsumed = page->precedingPostId;
        }

        domain::PostBatch batch;
        batch.contiguous = !m_recordsLost;
        std::size_t lastAccepted = 0;

        for (std::size_t i = 0; i < page->posts.size(); ++i) {
            const domain::Post& post = page->posts[i];
            Verdict verdict = classify(post);
            if (verdict == Verdict::Stop) {
                stop(StopReason::ConditionHit);
                break;
            }
            if (verdict == Verdict::Skip) {
                ++m_skipped;
                m_lastConsumed = post.id;
                continue;
            }

            if (batch.posts.empty()) {
                batch.anchorPostId = m_lastConsumed;
            }
            batch.posts.push_back(post);
            lastAccepted = i;
            m_lastConsumed = post.id;
            ++m_accepted;

            const auto accepted = static_cast<std::int64_t>(m_accepted);
            const bool totalHit = m_totalRemaining && accepted >= *m_totalRemaining;
            const bool sessionHit = m_sessionRemaining && accepted >= *m_sessionRemaining;
            if (totalHit || sessionHit) {
                stop(totalHit ? StopReason::TotalLimitHit : StopReason::SessionLimitHit);
                break;
            }
        }

        if (page->lastRecordId) {
            m_cursor = page->lastRecordId;
        }
        if (page->exhausted || !page->lastRecordId) {
            stop(StopReason::NoMorePosts);
        }

        if (!batch.posts.empty()) {
            const std::size_t following = lastAccepted + 1;
            batch.followingPostId = following < page->posts.size()
                ? std::optional<std::string>(page->posts[following].id)
                : page->followingPostId;
            // Malformed records of this page may follow its last accepted post.
            m_recordsLost = page->malformedCount > 0;
            return batch;
        }
        if (m_stopReason) {
            return std::nullopt;
        }
    }
}

} // namespace chatvault::application

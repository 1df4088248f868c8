/**
 * @file SyncTypes.hpp
 * @brief Value types exchanged between the fetch port, the planner and the merger.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "domain/ArchiveHeader.hpp"
#include "domain/Entities.hpp"

namespace chatvault::domain {

/**
 * @enum StopReason
 * @brief Why fetching of a channel ended.
 */
enum class StopReason {
    NoMorePosts,       ///< Remote exhausted in the direction of travel.
    ConditionHit,      ///< A post beyond a time / post-id bound was reached.
    SessionLimitHit,   ///< sessionPostLimit reached.
    TotalLimitHit,     ///< maximumPostCount reached for the archive.
    ConnectionTimeout, ///< Transport retries exhausted.
    Interrupted        ///< Cancellation requested.
};

inline std::string StopReasonToString(StopReason reason) {
    switch (reason) {
        case StopReason::NoMorePosts: return "NoMorePosts";
        case StopReason::ConditionHit: return "ConditionHit";
        case StopReason::SessionLimitHit: return "SessionLimitHit";
        case StopReason::TotalLimitHit: return "TotalLimitHit";
        case StopReason::ConnectionTimeout: return "ConnectionTimeout";
        case StopReason::Interrupted: return "Interrupted";
        default: return "Unknown";
    }
}

/** @brief Reasons after which the archive content is complete up to the stop point. */
inline bool IsOrderlyStop(StopReason reason) {
    return reason != StopReason::ConnectionTimeout && reason != StopReason::Interrupted;
}

/**
 * @struct PostPage
 * @brief One page returned by the remote fetch port, ordered in the requested direction.
 */
struct PostPage {
    std::vector<Post> posts;
    std::optional<std::string> precedingPostId; ///< Post just before posts.front() in travel direction.
    std::optional<std::string> followingPostId; ///< Post just after posts.back() in travel direction.
    std::optional<std::string> firstRecordId;   ///< First record of the page, malformed or not.
    std::optional<std::string> lastRecordId;    ///< Last record of the page, malformed or not; the next cursor.
    bool exhausted = false;                     ///< Nothing more in the direction of travel.
    std::size_t malformedCount = 0;             ///< Records dropped because required fields were missing.
};

/**
 * @struct PostBatch
 * @brief Accepted posts of one page, as handed from the planner to the merger.
 */
struct PostBatch {
    std::vector<Post> posts;                     ///< In travel direction, never empty.
    std::optional<std::string> anchorPostId;     ///< Last post consumed before posts.front(); none at the channel edge.
    std::optional<std::string> followingPostId;  ///< Post right after posts.back(); none at the channel edge.
    bool contiguous = true;                      ///< False if records between anchor and the batch end were lost.
};

/**
 * @enum CompatibilityAction
 * @brief Outcome of comparing an existing archive with a new request.
 */
enum class CompatibilityAction {
    Skip,               ///< Leave the channel untouched.
    Fresh,              ///< No archive yet.
    Append,             ///< Extend the existing archive.
    RebuildWithBackup,  ///< Rename the existing pair, then start fresh.
    RebuildWithDelete   ///< Remove the existing pair, then start fresh.
};

inline std::string CompatibilityActionToString(CompatibilityAction action) {
    switch (action) {
        case CompatibilityAction::Skip: return "skip";
        case CompatibilityAction::Fresh: return "fresh";
        case CompatibilityAction::Append: return "append";
        case CompatibilityAction::RebuildWithBackup: return "rebuild-with-backup";
        case CompatibilityAction::RebuildWithDelete: return "rebuild-with-delete";
        default: return "skip";
    }
}

/**
 * @struct ChannelSummary
 * @brief Terminal report of one channel run.
 */
struct ChannelSummary {
    std::string archiveName;
    CompatibilityAction action = CompatibilityAction::Skip;
    std::string reason;                    ///< Why the action was chosen.
    std::optional<StopReason> stopReason;  ///< Unset when nothing was fetched.
    std::size_t postsWritten = 0;
    std::size_t postsSkipped = 0;          ///< Filtered out by time / post-id bounds.
    std::size_t postsMalformed = 0;
    std::optional<StorageInfo> storage;    ///< Final storage state, if the archive exists.
    std::optional<std::string> error;      ///< Channel-level failure, if any.
};

} // namespace chatvault::domain

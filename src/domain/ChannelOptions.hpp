/**
 * @file ChannelOptions.hpp
 * @brief Fully resolved per-channel download request.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/Time.hpp"

namespace chatvault::domain {

/**
 * @enum OrderDirection
 * @brief Direction of travel through channel history.
 */
enum class OrderDirection {
    Asc, ///< Toward newer posts (download from oldest).
    Desc ///< Toward older posts (download from newest).
};

inline std::string DirectionToString(OrderDirection direction) {
    return direction == OrderDirection::Asc ? "Asc" : "Desc";
}

/**
 * @enum ArchiveAction
 * @brief What to do with an existing archive that is about to be extended or replaced.
 */
enum class ArchiveAction {
    Update, ///< Extend the existing archive.
    Backup, ///< Rename the existing pair and start from scratch.
    Delete, ///< Remove the existing pair and start from scratch.
    Skip    ///< Leave the channel untouched.
};

inline std::string ArchiveActionToString(ArchiveAction action) {
    switch (action) {
        case ArchiveAction::Update: return "update";
        case ArchiveAction::Backup: return "backup";
        case ArchiveAction::Delete: return "delete";
        case ArchiveAction::Skip: return "skip";
        default: return "skip";
    }
}

inline std::optional<ArchiveAction> ArchiveActionFromString(const std::string& value) {
    if (value == "update") return ArchiveAction::Update;
    if (value == "backup") return ArchiveAction::Backup;
    if (value == "delete") return ArchiveAction::Delete;
    if (value == "skip") return ArchiveAction::Skip;
    return std::nullopt;
}

/// Marker for "no limit" in post count options.
constexpr std::int64_t kUnlimited = -1;

struct AttachmentOptions {
    bool download = false;
    std::int64_t maxSize = 0; ///< 0 means no limit.
    std::vector<std::string> allowedMimeTypes; ///< Empty means every type.
};

/**
 * @struct FetchBounds
 * @brief Direction and fixed post-id / time bounds of a download.
 *
 * `after*` bounds exclude everything at or before them, `before*` bounds everything at or after them.
 */
struct FetchBounds {
    OrderDirection direction = OrderDirection::Asc;
    std::optional<std::string> afterPost;
    std::optional<std::string> beforePost;
    std::optional<Timestamp> afterTime;
    std::optional<Timestamp> beforeTime;
};

/**
 * @struct ChannelOptions
 * @brief Per-channel options produced by the configuration layer.
 */
struct ChannelOptions {
    FetchBounds bounds;
    std::int64_t maximumPostCount = kUnlimited; ///< 0 skips the channel.
    std::int64_t sessionPostLimit = kUnlimited; ///< 0 skips the channel.
    ArchiveAction onExistingCompatible = ArchiveAction::Update;
    ArchiveAction onExistingIncompatible = ArchiveAction::Backup;
    bool repairUncommitted = false; ///< Truncate an uncommitted data tail instead of rebuilding.
    AttachmentOptions attachments;
    bool emojiMetadata = false;
    bool downloadEmoji = false;
    bool downloadAvatars = false;
};

} // namespace chatvault::domain

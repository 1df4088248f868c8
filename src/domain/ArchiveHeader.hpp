/**
 * @file ArchiveHeader.hpp
 * @brief Header record describing one channel archive and its post storage.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/ChannelOptions.hpp"
#include "domain/Entities.hpp"

namespace chatvault::domain {

/**
 * @enum PostOrdering
 * @brief How posts are organized in the data file.
 */
enum class PostOrdering {
    Unsorted,             ///< May even contain duplicates.
    Ascending,            ///< Oldest to newest.
    Descending,           ///< Newest to oldest.
    AscendingContinuous,  ///< Oldest to newest, nothing missing inside the covered range.
    DescendingContinuous  ///< Newest to oldest, nothing missing inside the covered range.
};

inline std::string OrderingToString(PostOrdering ordering) {
    switch (ordering) {
        case PostOrdering::Unsorted: return "Unsorted";
        case PostOrdering::Ascending: return "Ascending";
        case PostOrdering::Descending: return "Descending";
        case PostOrdering::AscendingContinuous: return "AscendingContinuous";
        case PostOrdering::DescendingContinuous: return "DescendingContinuous";
        default: return "Unsorted";
    }
}

inline std::optional<PostOrdering> OrderingFromString(const std::string& value) {
    if (value == "Unsorted") return PostOrdering::Unsorted;
    if (value == "Ascending") return PostOrdering::Ascending;
    if (value == "Descending") return PostOrdering::Descending;
    if (value == "AscendingContinuous") return PostOrdering::AscendingContinuous;
    if (value == "DescendingContinuous") return PostOrdering::DescendingContinuous;
    return std::nullopt;
}

inline bool IsContinuous(PostOrdering ordering) {
    return ordering == PostOrdering::AscendingContinuous || ordering == PostOrdering::DescendingContinuous;
}

/** @brief Continuous ordering that grows in the given fetch direction. */
inline PostOrdering ContinuousOrderingFor(OrderDirection direction) {
    return direction == OrderDirection::Asc ? PostOrdering::AscendingContinuous
                                            : PostOrdering::DescendingContinuous;
}

/** @brief Drops the continuity guarantee while keeping the sort direction. */
inline PostOrdering WithoutContinuity(PostOrdering ordering) {
    switch (ordering) {
        case PostOrdering::AscendingContinuous: return PostOrdering::Ascending;
        case PostOrdering::DescendingContinuous: return PostOrdering::Descending;
        default: return ordering;
    }
}

/** @brief Direction in which an archive with this ordering grows, if it is sorted at all. */
inline std::optional<OrderDirection> GrowthDirection(PostOrdering ordering) {
    switch (ordering) {
        case PostOrdering::Ascending:
        case PostOrdering::AscendingContinuous:
            return OrderDirection::Asc;
        case PostOrdering::Descending:
        case PostOrdering::DescendingContinuous:
            return OrderDirection::Desc;
        default:
            return std::nullopt;
    }
}

/**
 * @struct StorageInfo
 * @brief Derived description of the data file.
 *
 * Times and post ids follow storage order: `first*`/`beginTime` describe the first record
 * in the file, `last*`/`endTime` the last one. When `count == 0` only `organization` and
 * `byteSize` are meaningful.
 */
struct StorageInfo {
    std::int64_t count = 0;
    std::uint64_t byteSize = 0;
    PostOrdering organization = PostOrdering::Unsorted;
    std::optional<Timestamp> beginTime;
    std::optional<Timestamp> endTime;
    std::optional<std::string> firstPostId;
    std::optional<std::string> lastPostId;
    std::optional<std::string> postIdBeforeFirst; ///< Known post preceding the first one; none if first is the channel edge.
    std::optional<std::string> postIdAfterLast;   ///< Known post following the last one; none if last is the channel edge.
    nlohmann::json misc = nlohmann::json::object();
};

/**
 * @struct ArchiveHeader
 * @brief Authoritative description of the paired post sequence.
 */
struct ArchiveHeader {
    static constexpr const char* CurrentVersion = "0";

    std::string version = CurrentVersion;
    Channel channel;
    std::optional<Team> team;
    std::vector<User> users;
    std::vector<Emoji> emojis;
    StorageInfo storage;
    nlohmann::json misc = nlohmann::json::object();

    const User* findUser(const std::string& userId) const {
        for (const auto& u : users) {
            if (u.id == userId) return &u;
        }
        return nullptr;
    }

    User* findUser(const std::string& userId) {
        for (auto& u : users) {
            if (u.id == userId) return &u;
        }
        return nullptr;
    }

    Emoji* findEmoji(const std::string& emojiId) {
        for (auto& e : emojis) {
            if (e.id == emojiId) return &e;
        }
        return nullptr;
    }

    /** @brief Adds the user unless one with the same id is present. @return True if added. */
    bool addUser(const User& user) {
        if (findUser(user.id)) return false;
        users.push_back(user);
        return true;
    }

    bool addEmoji(const Emoji& emoji) {
        if (findEmoji(emoji.id)) return false;
        emojis.push_back(emoji);
        return true;
    }
};

} // namespace chatvault::domain

/**
 * @file Entities.hpp
 * @brief Domain entities mirrored from the remote messaging platform.
 *
 * Every entity carries a `misc` object holding remote fields the archive format does
 * not model explicitly, so nothing the server sends is lost across API revisions.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Time.hpp"

namespace chatvault::domain {

/**
 * @enum ChannelType
 * @brief Visibility class of a channel.
 */
enum class ChannelType {
    Open,    ///< Public channel of a team.
    Private, ///< Invite-only channel of a team.
    Group,   ///< Group conversation (not scoped under a team).
    Direct   ///< One-to-one conversation.
};

/**
 * @enum TeamType
 * @brief Membership policy of a team.
 */
enum class TeamType {
    Open,
    InviteOnly
};

inline std::string ChannelTypeToString(ChannelType type) {
    switch (type) {
        case ChannelType::Open: return "Open";
        case ChannelType::Private: return "Private";
        case ChannelType::Group: return "Group";
        case ChannelType::Direct: return "Direct";
        default: return "Open";
    }
}

inline std::optional<ChannelType> ChannelTypeFromString(const std::string& value) {
    if (value == "Open") return ChannelType::Open;
    if (value == "Private") return ChannelType::Private;
    if (value == "Group") return ChannelType::Group;
    if (value == "Direct") return ChannelType::Direct;
    return std::nullopt;
}

inline std::string TeamTypeToString(TeamType type) {
    return type == TeamType::InviteOnly ? "InviteOnly" : "Open";
}

inline std::optional<TeamType> TeamTypeFromString(const std::string& value) {
    if (value == "Open") return TeamType::Open;
    if (value == "InviteOnly") return TeamType::InviteOnly;
    return std::nullopt;
}

struct User {
    std::string id;
    std::string name; ///< Login name, used in archive file names.
    Timestamp createTime = 0;
    std::optional<Timestamp> updateTime;
    std::optional<Timestamp> deleteTime;
    std::optional<std::string> firstName;
    std::optional<std::string> lastName;
    std::optional<std::string> nickname;
    std::optional<std::string> position;
    std::optional<Timestamp> updateAvatarTime;
    std::vector<std::string> roles; ///< Empty when the user only has the default role.
    std::optional<std::string> avatarFileName; ///< Set once the avatar is stored locally.
    nlohmann::json misc = nlohmann::json::object();
};

struct Emoji {
    std::string id;
    std::string name;
    std::optional<std::string> creatorId;
    Timestamp createTime = 0;
    std::optional<Timestamp> updateTime;
    std::optional<Timestamp> deleteTime;
    std::optional<std::string> creatorName;
    std::optional<std::string> imageFileName;
    nlohmann::json misc = nlohmann::json::object();
};

struct FileAttachment {
    std::string id;
    std::string name;
    std::int64_t byteSize = 0;
    std::optional<std::string> mimeType;
    Timestamp createTime = 0;
    std::optional<Timestamp> updateTime;
    std::optional<Timestamp> deleteTime;
    nlohmann::json misc = nlohmann::json::object();
};

/**
 * @struct PostReaction
 * @brief Reaction of a user to a post. Exactly one of emojiId / emojiName is set.
 */
struct PostReaction {
    std::string userId;
    Timestamp createTime = 0;
    std::optional<Timestamp> updateTime;
    std::optional<Timestamp> deleteTime;
    std::optional<std::string> emojiId;
    std::optional<std::string> emojiName;
    std::optional<std::string> userName; ///< Redundant, only with human friendly output.
    nlohmann::json misc = nlohmann::json::object();
};

struct Post {
    std::string id;
    std::string userId;
    Timestamp createTime = 0;
    std::string message;

    std::optional<bool> isPinned;
    std::optional<Timestamp> updateTime;
    std::optional<Timestamp> publicUpdateTime; ///< Last visible edit.
    std::optional<Timestamp> deleteTime;
    std::optional<std::string> parentPostId;
    std::optional<std::string> rootPostId;
    std::optional<std::string> specialMsgType;

    std::vector<std::string> emojiIds;      ///< Stored form of emoji references.
    std::vector<Emoji> embeddedEmojis;      ///< Full emoji records as delivered by the remote, never stored in posts.
    std::vector<FileAttachment> attachments;
    std::vector<PostReaction> reactions;

    std::optional<std::string> userName; ///< Redundant, only with human friendly output.
    nlohmann::json misc = nlohmann::json::object();
};

struct Team {
    std::string id;
    std::string name;         ///< Display name.
    std::string internalName; ///< URL name.
    TeamType type = TeamType::Open;
    Timestamp createTime = 0;
    std::optional<Timestamp> updateTime;
    std::optional<Timestamp> deleteTime;
    std::optional<std::string> description;
    std::optional<Timestamp> updateAvatarTime;
    std::optional<std::string> inviteId;
    nlohmann::json misc = nlohmann::json::object();
};

struct Channel {
    std::string id;
    std::string internalName;
    std::optional<std::string> name; ///< Display name.
    ChannelType type = ChannelType::Open;
    std::int64_t messageCount = 0; ///< Approximate, deleted posts are still counted.
    Timestamp createTime = 0;
    std::optional<Timestamp> updateTime;
    std::optional<Timestamp> deleteTime;
    std::optional<std::string> creatorUserId;
    std::optional<std::string> header;
    std::optional<std::string> purpose;
    std::optional<std::int64_t> rootMessageCount;
    std::optional<Timestamp> lastPostTime;
    std::optional<std::string> teamId; ///< Runtime only, not stored.
    nlohmann::json misc = nlohmann::json::object();
};

} // namespace chatvault::domain

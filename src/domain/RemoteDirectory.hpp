/**
 * @file RemoteDirectory.hpp
 * @brief Interface for remote metadata lookups and asset downloads.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/Entities.hpp"

namespace chatvault::domain {

/**
 * @struct RemoteAsset
 * @brief Binary payload downloaded from the remote.
 */
struct RemoteAsset {
    std::string content;
    std::string contentType; ///< May be empty if the server did not send one.
};

/**
 * @class RemoteDirectory
 * @brief Teams, channels and users visible to the logged-in account.
 */
class RemoteDirectory {
public:
    virtual ~RemoteDirectory() = default;

    /** @brief Authenticates (if needed) and returns the local user. */
    virtual User login() = 0;

    virtual std::vector<Team> listTeams() = 0;

    /** @brief Channels of the local user within a team, including direct and group conversations. */
    virtual std::vector<Channel> listChannels(const std::string& teamId) = 0;

    virtual std::optional<User> findUserById(const std::string& userId) = 0;
    virtual std::optional<User> findUserByName(const std::string& userName) = 0;

    virtual std::vector<User> listChannelMembers(const std::string& channelId) = 0;

    /** @brief Custom emoji database of the server. */
    virtual std::vector<Emoji> listEmojis() = 0;

    virtual RemoteAsset downloadAttachment(const FileAttachment& attachment) = 0;
    virtual RemoteAsset downloadEmojiImage(const Emoji& emoji) = 0;
    virtual RemoteAsset downloadAvatar(const User& user) = 0;

    /** @brief Name of the direct channel between the local user and another user. */
    virtual std::string directChannelName(const std::string& localUserId, const std::string& otherUserId) const = 0;
};

} // namespace chatvault::domain

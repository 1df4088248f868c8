/**
 * @file MattermostAdapter.hpp
 * @brief Adapter exposing a Mattermost server through the engine's remote ports.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/RemoteDirectory.hpp"
#include "domain/RemoteFetchPort.hpp"
#include "infrastructure/MattermostClient.hpp"

namespace chatvault::infrastructure {

/**
 * @class MattermostAdapter
 * @brief Implements RemoteFetchPort and RemoteDirectory using the Mattermost REST API.
 *
 * The server pages posts newest-first only, so ascending pages are reversed and an
 * ascending scan cannot start without a cursor (supportsReverseCursor() is false).
 */
class MattermostAdapter : public domain::RemoteFetchPort, public domain::RemoteDirectory {
public:
    /**
     * @brief Constructor for MattermostAdapter.
     * @param hostname Server base URL.
     * @param username Login name; also used to resolve the local user.
     * @param password Used for login() when no token is given.
     * @param token Personal access or session token; skips the password login.
     * @param pageDelay Pause between consecutive pages of multi-page listings.
     */
    MattermostAdapter(const std::string& hostname,
                      std::string username,
                      std::string password,
                      std::string token,
                      std::chrono::milliseconds pageDelay);

    // RemoteFetchPort
    bool supportsReverseCursor() const override { return false; }
    domain::PostPage fetchPosts(const std::string& channelId,
                                const std::optional<std::string>& cursor,
                                domain::OrderDirection direction,
                                int batchSize) override;
    std::optional<domain::Post> fetchPost(const std::string& postId) override;
    std::optional<domain::User> fetchUser(const std::string& userId) override;

    // RemoteDirectory
    domain::User login() override;
    std::vector<domain::Team> listTeams() override;
    std::vector<domain::Channel> listChannels(const std::string& teamId) override;
    std::optional<domain::User> findUserById(const std::string& userId) override;
    std::optional<domain::User> findUserByName(const std::string& userName) override;
    std::vector<domain::User> listChannelMembers(const std::string& channelId) override;
    std::vector<domain::Emoji> listEmojis() override;
    domain::RemoteAsset downloadAttachment(const domain::FileAttachment& attachment) override;
    domain::RemoteAsset downloadEmojiImage(const domain::Emoji& emoji) override;
    domain::RemoteAsset downloadAvatar(const domain::User& user) override;
    std::string directChannelName(const std::string& localUserId, const std::string& otherUserId) const override;

private:
    void pause() const;

    MattermostClient m_client;
    std::string m_username;
    std::string m_password;
    std::chrono::milliseconds m_pageDelay;
    std::map<std::string, domain::User> m_users; ///< Cache by user id.
    std::optional<std::vector<domain::Emoji>> m_emojis;
};

} // namespace chatvault::infrastructure

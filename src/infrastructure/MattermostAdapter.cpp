/**
 * @file MattermostAdapter.cpp
 * @brief Implementation of the MattermostAdapter class.
 */

#include "infrastructure/MattermostAdapter.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/MattermostMapper.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace chatvault::infrastructure {

namespace {

constexpr int kMemberPageSize = 100;
constexpr int kEmojiPageSize = 100;
constexpr int kMaxPostPageSize = 200;

std::optional<std::string> NonEmpty(const json& value) {
    if (value.is_string() && !value.get<std::string>().empty()) {
        return value.get<std::string>();
    }
    return std::nullopt;
}

} // namespace

MattermostAdapter::MattermostAdapter(const std::string& hostname,
                                     std::string username,
                                     std::string password,
                                     std::string token,
                                     std::chrono::milliseconds pageDelay)
    : m_client(hostname),
      m_username(std::move(username)),
      m_password(std::move(password)),
      m_pageDelay(pageDelay) {
    if (!token.empty()) {
        m_client.setToken(token);
    }
}

void MattermostAdapter::pause() const {
    if (m_pageDelay.count() > 0) {
        std::this_thread::sleep_for(m_pageDelay);
    }
}

domain::PostPage MattermostAdapter::fetchPosts(const std::string& channelId,
                                               const std::optional<std::string>& cursor,
                                               domain::OrderDirection direction,
                                               int batchSize) {
    const bool ascending = direction == domain::OrderDirection::Asc;
    if (ascending && !cursor) {
        throw std::invalid_argument("Ascending post scan requires a cursor post");
    }

    MattermostClient::QueryParams params;
    params.emplace("per_page", std::to_string(std::clamp(batchSize, 1, kMaxPostPageSize)));
    if (cursor) {
        params.emplace(ascending ? "after" : "before", *cursor);
    }

    json window = m_client.getJson("channels/" + channelId + "/posts", params);
    if (!window.is_object()) {
        throw domain::TransportFailure("Post page of channel " + channelId + " is not an object");
    }

    std::vector<std::string> order;
    if (window.contains("order") && window["order"].is_array()) {
        for (const auto& id : window["order"]) {
            if (id.is_string()) order.push_back(id.get<std::string>());
        }
    }
    // Server order is newest first.
    if (ascending) {
        std::reverse(order.begin(), order.end());
    }

    domain::PostPage page;
    const json& posts = window.contains("posts") && window["posts"].is_object() ? window["posts"] : json::object();
    for (const auto& id : order) {
        auto it = posts.find(id);
        if (it == posts.end()) {
            Logger::Warning("MattermostAdapter", "Post " + id + " listed in page order but not delivered.");
            ++page.malformedCount;
            continue;
        }
        try {
            page.posts.push_back(MattermostMapper::MapPost(*it));
        } catch (const domain::MalformedRecordError& e) {
            Logger::Warning("MattermostAdapter", std::string("Skipping post ") + id + ": " + e.what());
            ++page.malformedCount;
        }
    }

    auto newer = NonEmpty(window.value("next_post_id", json()));
    auto older = NonEmpty(window.value("prev_post_id", json()));
    if (ascending) {
        page.precedingPostId = older;
        page.followingPostId = newer;
    } else {
        page.precedingPostId = newer;
        page.followingPostId = older;
    }
    if (!order.empty()) {
        page.firstRecordId = order.front();
        page.lastRecordId = order.back();
    }
    page.exhausted = order.empty() || !page.followingPostId;
    return page;
}

std::optional<domain::Post> MattermostAdapter::fetchPost(const std::string& postId) {
    try {
        return MattermostMapper::MapPost(m_client.getJson("posts/" + postId));
    } catch (const domain::RemoteRequestError& e) {
        if (e.status() == 404) return std::nullopt;
        throw;
    } catch (const domain::MalformedRecordError& e) {
        Logger::Warning("MattermostAdapter", std::string("Post ") + postId + " is malformed: " + e.what());
        return std::nullopt;
    }
}

std::optional<domain::User> MattermostAdapter::fetchUser(const std::string& userId) {
    return findUserById(userId);
}

domain::User MattermostAdapter::login() {
    if (!m_client.hasToken()) {
        if (m_password.empty()) {
            throw domain::AuthFailure("Neither a token nor a password is configured");
        }
        m_client.login(m_username, m_password);
    }
    try {
        domain::User me = MattermostMapper::MapUser(m_client.getJson("users/me"));
        m_users[me.id] = me;
        Logger::Info("MattermostAdapter", "Connected to " + m_client.hostname() + " as " + me.name);
        return me;
    } catch (const domain::MalformedRecordError& e) {
        throw domain::AuthFailure(std::string("Local user record is malformed: ") + e.what());
    }
}

std::vector<domain::Team> MattermostAdapter::listTeams() {
    std::vector<domain::Team> teams;
    for (const auto& info : m_client.getJson("users/me/teams")) {
        try {
            teams.push_back(MattermostMapper::MapTeam(info));
        } catch (const domain::MalformedRecordError& e) {
            Logger::Warning("MattermostAdapter", std::string("Skipping team: ") + e.what());
        }
    }
    return teams;
}

std::vector<domain::Channel> MattermostAdapter::listChannels(const std::string& teamId) {
    std::vector<domain::Channel> channels;
    for (const auto& info : m_client.getJson("users/me/teams/" + teamId + "/channels")) {
        try {
            channels.push_back(MattermostMapper::MapChannel(info));
        } catch (const domain::MalformedRecordError& e) {
            Logger::Warning("MattermostAdapter", std::string("Skipping channel: ") + e.what());
        }
    }
    return channels;
}

std::optional<domain::User> MattermostAdapter::findUserById(const std::string& userId) {
    auto cached = m_users.find(userId);
    if (cached != m_users.end()) {
        return cached->second;
    }
    try {
        domain::User u = MattermostMapper::MapUser(m_client.getJson("users/" + userId));
        m_users[u.id] = u;
        return u;
    } catch (const domain::RemoteRequestError& e) {
        if (e.status() == 404) return std::nullopt;
        throw;
    } catch (const domain::MalformedRecordError& e) {
        Logger::Warning("MattermostAdapter", std::string("User ") + userId + " is malformed: " + e.what());
        return std::nullopt;
    }
}

std::optional<domain::User> MattermostAdapter::findUserByName(const std::string& userName) {
    for (const auto& entry : m_users) {
        if (entry.second.name == userName) return entry.second;
    }
    try {
        domain::User u = MattermostMapper::MapUser(m_client.getJson("users/username/" + userName));
        m_users[u.id] = u;
        return u;
    } catch (const domain::RemoteRequestError& e) {
        if (e.status() == 404) return std::nullopt;
        throw;
    } catch (const domain::MalformedRecordError& e) {
        Logger::Warning("MattermostAdapter", "User '" + userName + "' is malformed: " + e.what());
        return std::nullopt;
    }
}

std::vector<domain::User> MattermostAdapter::listChannelMembers(const std::string& channelId) {
    std::vector<domain::User> members;
    for (int page = 0;; ++page) {
        MattermostClient::QueryParams params;
        params.emplace("page", std::to_string(page));
        params.emplace("per_page", std::to_string(kMemberPageSize));
        json window = m_client.getJson("channels/" + channelId + "/members", params);
        for (const auto& m : window) {
            if (!m.contains("user_id") || !m["user_id"].is_string()) continue;
            if (auto u = findUserById(m["user_id"].get<std::string>())) {
                members.push_back(*u);
            }
        }
        if (window.size() < static_cast<std::size_t>(kMemberPageSize)) break;
        pause();
    }
    return members;
}

std::vector<domain::Emoji> MattermostAdapter::listEmojis() {
    if (m_emojis) return *m_emojis;

    std::vector<domain::Emoji> emojis;
    for (int page = 0;; ++page) {
        MattermostClient::QueryParams params;
        params.emplace("page", std::to_string(page));
        params.emplace("per_page", std::to_string(kEmojiPageSize));
        json window = m_client.getJson("emoji", params);
        for (const auto& info : window) {
            try {
                emojis.push_back(MattermostMapper::MapEmoji(info));
            } catch (const domain::MalformedRecordError& e) {
                Logger::Warning("MattermostAdapter", std::string("Skipping emoji: ") + e.what());
            }
        }
        if (window.size() < static_cast<std::size_t>(kEmojiPageSize)) break;
        pause();
    }
    m_emojis = emojis;
    return emojis;
}

domain::RemoteAsset MattermostAdapter::downloadAttachment(const domain::FileAttachment& attachment) {
    return m_client.getRaw("files/" + attachment.id);
}

domain::RemoteAsset MattermostAdapter::downloadEmojiImage(const domain::Emoji& emoji) {
    return m_client.getRaw("emoji/" + emoji.id + "/image");
}

domain::RemoteAsset MattermostAdapter::downloadAvatar(const domain::User& user) {
    return m_client.getRaw("users/" + user.id + "/image");
}

std::string MattermostAdapter::directChannelName(const std::string& localUserId, const std::string& otherUserId) const {
    if (localUserId < otherUserId) {
        return localUserId + "__" + otherUserId;
    }
    return otherUserId + "__" + localUserId;
}

} // namespace chatvault::infrastructure

/**
 * @file MattermostMapper.cpp
 * @brief Implementation of MattermostMapper.
 */

#include "infrastructure/MattermostMapper.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"

#include <sstream>

namespace chatvault::infrastructure {

using json = nlohmann::json;

namespace {

/**
 * @brief Takes fields out of a server record; what is left over becomes misc.
 */
class RemoteRecord {
public:
    RemoteRecord(const json& info, const char* entity) : m_info(info), m_entity(entity) {
        if (!m_info.is_object()) {
            throw domain::MalformedRecordError(std::string(entity) + " record is not an object");
        }
    }

    template <typename T>
    T extract(const char* key) {
        auto it = m_info.find(key);
        if (it == m_info.end() || it->is_null()) {
            throw domain::MalformedRecordError(std::string(m_entity) + " record lacks required field '" + key + "'");
        }
        try {
            T value = it->get<T>();
            m_info.erase(it);
            return value;
        } catch (const json::exception&) {
            throw domain::MalformedRecordError(std::string(m_entity) + " field '" + key + "' has unexpected type");
        }
    }

    /** @brief Optional field; null, missing, empty and mistyped values yield std::nullopt. */
    template <typename T>
    std::optional<T> extractOptional(const char* key) {
        auto it = m_info.find(key);
        if (it == m_info.end()) return std::nullopt;
        json value = *it;
        m_info.erase(it);
        if (value.is_null()) return std::nullopt;
        if (value.is_string() && value.get<std::string>().empty()) return std::nullopt;
        try {
            return value.get<T>();
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }

    json extractRaw(const char* key) {
        auto it = m_info.find(key);
        if (it == m_info.end()) return json();
        json value = *it;
        m_info.erase(it);
        return value;
    }

    void drop(const char* key) { m_info.erase(key); }

    /** @brief Remaining fields, without nulls, empty strings and empty objects. */
    json misc() const {
        json result = json::object();
        for (const auto& el : m_info.items()) {
            const json& v = el.value();
            if (v.is_null()) continue;
            if (v.is_string() && v.get<std::string>().empty()) continue;
            if (v.is_object() && v.empty()) continue;
            result[el.key()] = v;
        }
        return result;
    }

private:
    json m_info;
    const char* m_entity;
};

std::optional<domain::Timestamp> NonZero(std::optional<domain::Timestamp> value) {
    if (value && *value != 0) return value;
    return std::nullopt;
}

std::optional<domain::Timestamp> UnlessEqual(std::optional<domain::Timestamp> value, domain::Timestamp reference) {
    if (value && *value != reference) return value;
    return std::nullopt;
}

/** @brief Props object without the listed keys and empty-string values. */
json FilterProps(const json& props, std::initializer_list<const char*> ignored) {
    json result = json::object();
    if (!props.is_object()) return result;
    for (const auto& el : props.items()) {
        bool skip = false;
        for (const char* key : ignored) {
            if (el.key() == key) skip = true;
        }
        if (skip) continue;
        if (el.value().is_string() && el.value().get<std::string>().empty()) continue;
        result[el.key()] = el.value();
    }
    return result;
}

} // namespace

domain::ChannelType MattermostMapper::MapChannelType(const std::string& letter) {
    if (letter == "O") return domain::ChannelType::Open;
    if (letter == "P") return domain::ChannelType::Private;
    if (letter == "G") return domain::ChannelType::Group;
    if (letter == "D") return domain::ChannelType::Direct;
    Logger::Warning("MattermostMapper", "Unknown channel type '" + letter + "', assumed open.");
    return domain::ChannelType::Open;
}

domain::User MattermostMapper::MapUser(const json& info) {
    RemoteRecord r(info, "User");
    domain::User u;
    u.id = r.extract<std::string>("id");
    u.name = r.extract<std::string>("username");
    u.createTime = r.extract<domain::Timestamp>("create_at");
    u.nickname = r.extractOptional<std::string>("nickname");
    u.firstName = r.extractOptional<std::string>("first_name");
    u.lastName = r.extractOptional<std::string>("last_name");
    u.updateTime = UnlessEqual(r.extractOptional<domain::Timestamp>("update_at"), u.createTime);
    u.deleteTime = NonZero(r.extractOptional<domain::Timestamp>("delete_at"));
    u.updateAvatarTime = UnlessEqual(NonZero(r.extractOptional<domain::Timestamp>("last_picture_update")), u.createTime);
    u.position = r.extractOptional<std::string>("position");

    if (auto roles = r.extractOptional<std::string>("roles")) {
        std::istringstream stream(*roles);
        std::string role;
        std::vector<std::string> parsed;
        while (stream >> role) parsed.push_back(role);
        if (!(parsed.size() == 1 && parsed.front() == "system_user")) {
            u.roles = parsed;
        }
    }

    json props = FilterProps(r.extractRaw("props"), {"customStatus"});

    r.drop("auth_service");
    r.drop("auth_data");
    r.drop("email");
    r.drop("email_verified");
    r.drop("disable_welcome_email");
    r.drop("last_password_update");
    r.drop("locale");
    r.drop("timezone");
    r.drop("notify_props");

    u.misc = r.misc();
    if (!props.empty()) u.misc["props"] = props;
    return u;
}

domain::Emoji MattermostMapper::MapEmoji(const json& info) {
    RemoteRecord r(info, "Emoji");
    domain::Emoji e;
    e.id = r.extract<std::string>("id");
    e.creatorId = r.extract<std::string>("creator_id");
    e.name = r.extract<std::string>("name");
    e.createTime = r.extract<domain::Timestamp>("create_at");
    e.updateTime = UnlessEqual(r.extractOptional<domain::Timestamp>("update_at"), e.createTime);
    e.deleteTime = NonZero(r.extractOptional<domain::Timestamp>("delete_at"));
    e.misc = r.misc();
    return e;
}

domain::FileAttachment MattermostMapper::MapAttachment(const json& info) {
    RemoteRecord r(info, "FileAttachment");
    domain::FileAttachment f;
    f.id = r.extract<std::string>("id");
    f.name = r.extract<std::string>("name");
    f.byteSize = r.extract<std::int64_t>("size");
    f.createTime = r.extract<domain::Timestamp>("create_at");
    f.mimeType = r.extractOptional<std::string>("mime_type");
    f.updateTime = UnlessEqual(r.extractOptional<domain::Timestamp>("update_at"), f.createTime);
    f.deleteTime = NonZero(r.extractOptional<domain::Timestamp>("delete_at"));

    r.drop("user_id");
    r.drop("post_id");
    r.drop("width");
    r.drop("height");
    r.drop("has_preview_image");
    r.drop("mini_preview");
    r.drop("extension");

    f.misc = r.misc();
    return f;
}

domain::PostReaction MattermostMapper::MapReaction(const json& info) {
    RemoteRecord r(info, "PostReaction");
    domain::PostReaction reaction;
    reaction.userId = r.extract<std::string>("user_id");
    reaction.createTime = r.extract<domain::Timestamp>("create_at");
    reaction.emojiName = r.extract<std::string>("emoji_name");
    reaction.updateTime = UnlessEqual(NonZero(r.extractOptional<domain::Timestamp>("update_at")), reaction.createTime);
    reaction.deleteTime = NonZero(r.extractOptional<domain::Timestamp>("delete_at"));
    r.drop("post_id");
    r.drop("channel_id");
    reaction.misc = r.misc();
    return reaction;
}

domain::Post MattermostMapper::MapPost(const json& info) {
    RemoteRecord r(info, "Post");
    domain::Post p;
    p.id = r.extract<std::string>("id");
    p.userId = r.extract<std::string>("user_id");
    p.createTime = r.extract<domain::Timestamp>("create_at");
    p.message = r.extract<std::string>("message");

    p.updateTime = UnlessEqual(r.extractOptional<domain::Timestamp>("update_at"), p.createTime);
    auto editTime = NonZero(r.extractOptional<domain::Timestamp>("edit_at"));
    if (editTime && (!p.updateTime || *editTime != *p.updateTime)) {
        p.publicUpdateTime = editTime;
    }
    p.deleteTime = NonZero(r.extractOptional<domain::Timestamp>("delete_at"));

    p.parentPostId = r.extractOptional<std::string>("parent_id");
    auto rootId = r.extractOptional<std::string>("root_id");
    if (rootId && rootId != p.parentPostId) {
        p.rootPostId = rootId;
    }
    if (r.extractOptional<bool>("is_pinned").value_or(false)) {
        p.isPinned = true;
    }

    json props = FilterProps(r.extractRaw("props"), {"disable_group_highlight", "channel_mentions"});
    p.specialMsgType = r.extractOptional<std::string>("type");

    json metadata = r.extractRaw("metadata");
    if (metadata.is_object()) {
        metadata.erase("embeds");
        metadata.erase("images");
        auto emojis = metadata.find("emojis");
        if (emojis != metadata.end() && emojis->is_array()) {
            for (const auto& e : *emojis) p.embeddedEmojis.push_back(MapEmoji(e));
        }
        metadata.erase("emojis");
        auto files = metadata.find("files");
        if (files != metadata.end() && files->is_array()) {
            for (const auto& f : *files) p.attachments.push_back(MapAttachment(f));
        }
        metadata.erase("files");
        auto reactions = metadata.find("reactions");
        if (reactions != metadata.end() && reactions->is_array()) {
            for (const auto& reaction : *reactions) p.reactions.push_back(MapReaction(reaction));
        }
        metadata.erase("reactions");
    }
    for (const auto& e : p.embeddedEmojis) {
        p.emojiIds.push_back(e.id);
    }

    r.drop("channel_id");
    r.drop("reply_count");
    r.drop("has_reactions");
    r.drop("file_ids");
    r.drop("hashtags");
    r.drop("last_reply_at");
    r.drop("pending_post_id");

    p.misc = r.misc();
    if (!props.empty()) p.misc["props"] = props;
    if (metadata.is_object() && !metadata.empty()) p.misc["metadata"] = metadata;
    return p;
}

domain::Channel MattermostMapper::MapChannel(const json& info) {
    RemoteRecord r(info, "Channel");
    domain::Channel ch;
    ch.id = r.extract<std::string>("id");
    ch.internalName = r.extract<std::string>("name");
    ch.type = MapChannelType(r.extract<std::string>("type"));
    ch.createTime = r.extract<domain::Timestamp>("create_at");
    ch.messageCount = r.extract<std::int64_t>("total_msg_count");
    ch.name = r.extractOptional<std::string>("display_name");
    ch.updateTime = UnlessEqual(r.extractOptional<domain::Timestamp>("update_at"), ch.createTime);
    ch.deleteTime = NonZero(r.extractOptional<domain::Timestamp>("delete_at"));
    ch.header = r.extractOptional<std::string>("header");
    ch.purpose = r.extractOptional<std::string>("purpose");
    ch.lastPostTime = NonZero(r.extractOptional<domain::Timestamp>("last_post_at"));
    ch.rootMessageCount = r.extractOptional<std::int64_t>("total_msg_count_root");
    ch.creatorUserId = r.extractOptional<std::string>("creator_id");
    ch.teamId = r.extractOptional<std::string>("team_id");

    r.drop("extra_update_at");
    r.drop("group_constrained");
    r.drop("last_root_post_at");

    ch.misc = r.misc();
    return ch;
}

domain::Team MattermostMapper::MapTeam(const json& info) {
    RemoteRecord r(info, "Team");
    domain::Team t;
    t.id = r.extract<std::string>("id");
    t.name = r.extract<std::string>("display_name");
    t.internalName = r.extract<std::string>("name");
    std::string type = r.extract<std::string>("type");
    if (type == "I") {
        t.type = domain::TeamType::InviteOnly;
    } else {
        if (type != "O") {
            Logger::Warning("MattermostMapper", "Unknown team type '" + type + "', assumed open.");
        }
        t.type = domain::TeamType::Open;
    }
    t.createTime = r.extract<domain::Timestamp>("create_at");
    t.updateTime = UnlessEqual(r.extractOptional<domain::Timestamp>("update_at"), t.createTime);
    t.deleteTime = NonZero(r.extractOptional<domain::Timestamp>("delete_at"));
    t.description = r.extractOptional<std::string>("description");
    t.updateAvatarTime = NonZero(r.extractOptional<domain::Timestamp>("last_team_icon_update"));
    t.inviteId = r.extractOptional<std::string>("invite_id");

    r.drop("allow_open_invite");
    r.drop("allowed_domains");
    r.drop("email");

    t.misc = r.misc();
    return t;
}

} // namespace chatvault::infrastructure

/**
 * @file ArchiveCodec.cpp
 * @brief Implementation of ArchiveCodec.
 */

#include "infrastructure/ArchiveCodec.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"

#include <cctype>

namespace chatvault::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void PutOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

void PutMisc(json& j, const json& misc) {
    if (misc.is_object() && !misc.empty()) {
        j["misc"] = misc;
    }
}

/**
 * @brief Consumes known keys of a store-form object; whatever remains becomes misc.
 */
class FieldReader {
public:
    FieldReader(const json& j, std::string entity) : m_j(j), m_entity(std::move(entity)) {
        if (!m_j.is_object()) {
            throw domain::ArchiveError(m_entity + " record is not a JSON object");
        }
    }

    template <typename T>
    T required(const char* key) {
        auto it = m_j.find(key);
        if (it == m_j.end() || it->is_null()) {
            throw domain::ArchiveError(m_entity + " record is missing '" + key + "'");
        }
        T value = convert<T>(*it, key);
        m_j.erase(it);
        return value;
    }

    template <typename T>
    std::optional<T> optional(const char* key) {
        auto it = m_j.find(key);
        if (it == m_j.end() || it->is_null()) {
            if (it != m_j.end()) m_j.erase(it);
            return std::nullopt;
        }
        T value = convert<T>(*it, key);
        m_j.erase(it);
        return value;
    }

    json take(const char* key) {
        auto it = m_j.find(key);
        if (it == m_j.end()) return json();
        json value = *it;
        m_j.erase(it);
        return value;
    }

    json misc() {
        json result = json::object();
        auto it = m_j.find("misc");
        if (it != m_j.end()) {
            if (it->is_object()) result = *it;
            m_j.erase(it);
        }
        for (const auto& el : m_j.items()) {
            result[el.key()] = el.value();
        }
        return result;
    }

private:
    template <typename T>
    T convert(const json& value, const char* key) {
        try {
            return value.get<T>();
        } catch (const json::exception& e) {
            throw domain::ArchiveError(m_entity + " field '" + key + "' has unexpected type: " + e.what());
        }
    }

    json m_j;
    std::string m_entity;
};

} // namespace

json ArchiveCodec::EncodeUser(const domain::User& user) {
    json j = {{"id", user.id}, {"name", user.name}, {"createTime", user.createTime}};
    PutOptional(j, "updateTime", user.updateTime);
    PutOptional(j, "deleteTime", user.deleteTime);
    PutOptional(j, "firstName", user.firstName);
    PutOptional(j, "lastName", user.lastName);
    PutOptional(j, "nickname", user.nickname);
    PutOptional(j, "position", user.position);
    PutOptional(j, "updateAvatarTime", user.updateAvatarTime);
    if (!user.roles.empty()) j["roles"] = user.roles;
    PutOptional(j, "avatarFileName", user.avatarFileName);
    PutMisc(j, user.misc);
    return j;
}

domain::User ArchiveCodec::DecodeUser(const json& j) {
    FieldReader r(j, "User");
    domain::User u;
    u.id = r.required<std::string>("id");
    u.name = r.required<std::string>("name");
    u.createTime = r.required<domain::Timestamp>("createTime");
    u.updateTime = r.optional<domain::Timestamp>("updateTime");
    u.deleteTime = r.optional<domain::Timestamp>("deleteTime");
    u.firstName = r.optional<std::string>("firstName");
    u.lastName = r.optional<std::string>("lastName");
    u.nickname = r.optional<std::string>("nickname");
    u.position = r.optional<std::string>("position");
    u.updateAvatarTime = r.optional<domain::Timestamp>("updateAvatarTime");
    u.roles = r.optional<std::vector<std::string>>("roles").value_or(std::vector<std::string>{});
    u.avatarFileName = r.optional<std::string>("avatarFileName");
    u.misc = r.misc();
    return u;
}

json ArchiveCodec::EncodeEmoji(const domain::Emoji& emoji) {
    json j = {{"id", emoji.id}, {"name", emoji.name}, {"createTime", emoji.createTime}};
    PutOptional(j, "creatorId", emoji.creatorId);
    PutOptional(j, "updateTime", emoji.updateTime);
    PutOptional(j, "deleteTime", emoji.deleteTime);
    PutOptional(j, "creatorName", emoji.creatorName);
    PutOptional(j, "imageFileName", emoji.imageFileName);
    PutMisc(j, emoji.misc);
    return j;
}

domain::Emoji ArchiveCodec::DecodeEmoji(const json& j) {
    FieldReader r(j, "Emoji");
    domain::Emoji e;
    e.id = r.required<std::string>("id");
    e.name = r.required<std::string>("name");
    e.createTime = r.required<domain::Timestamp>("createTime");
    e.creatorId = r.optional<std::string>("creatorId");
    e.updateTime = r.optional<domain::Timestamp>("updateTime");
    e.deleteTime = r.optional<domain::Timestamp>("deleteTime");
    e.creatorName = r.optional<std::string>("creatorName");
    e.imageFileName = r.optional<std::string>("imageFileName");
    e.misc = r.misc();
    return e;
}

json ArchiveCodec::EncodeAttachment(const domain::FileAttachment& attachment) {
    json j = {{"id", attachment.id}, {"name", attachment.name},
              {"byteSize", attachment.byteSize}, {"createTime", attachment.createTime}};
    PutOptional(j, "mimeType", attachment.mimeType);
    PutOptional(j, "updateTime", attachment.updateTime);
    PutOptional(j, "deleteTime", attachment.deleteTime);
    PutMisc(j, attachment.misc);
    return j;
}

domain::FileAttachment ArchiveCodec::DecodeAttachment(const json& j) {
    FieldReader r(j, "FileAttachment");
    domain::FileAttachment a;
    a.id = r.required<std::string>("id");
    a.name = r.required<std::string>("name");
    a.byteSize = r.required<std::int64_t>("byteSize");
    a.createTime = r.required<domain::Timestamp>("createTime");
    a.mimeType = r.optional<std::string>("mimeType");
    a.updateTime = r.optional<domain::Timestamp>("updateTime");
    a.deleteTime = r.optional<domain::Timestamp>("deleteTime");
    a.misc = r.misc();
    return a;
}

json ArchiveCodec::EncodeReaction(const domain::PostReaction& reaction) {
    json j = {{"userId", reaction.userId}, {"createTime", reaction.createTime}};
    PutOptional(j, "updateTime", reaction.updateTime);
    PutOptional(j, "deleteTime", reaction.deleteTime);
    PutOptional(j, "emojiId", reaction.emojiId);
    PutOptional(j, "emojiName", reaction.emojiName);
    PutOptional(j, "userName", reaction.userName);
    PutMisc(j, reaction.misc);
    return j;
}

domain::PostReaction ArchiveCodec::DecodeReaction(const json& j) {
    FieldReader r(j, "PostReaction");
    domain::PostReaction reaction;
    reaction.userId = r.required<std::string>("userId");
    reaction.createTime = r.required<domain::Timestamp>("createTime");
    reaction.updateTime = r.optional<domain::Timestamp>("updateTime");
    reaction.deleteTime = r.optional<domain::Timestamp>("deleteTime");
    reaction.emojiId = r.optional<std::string>("emojiId");
    reaction.emojiName = r.optional<std::string>("emojiName");
    reaction.userName = r.optional<std::string>("userName");
    reaction.misc = r.misc();
    if (reaction.emojiId.has_value() == reaction.emojiName.has_value()) {
        throw domain::ArchiveError("PostReaction must name its emoji by exactly one of id or name");
    }
    return reaction;
}

json ArchiveCodec::EncodePost(const domain::Post& post) {
    json j = {{"id", post.id}, {"userId", post.userId},
              {"createTime", post.createTime}, {"message", post.message}};
    PutOptional(j, "isPinned", post.isPinned);
    PutOptional(j, "updateTime", post.updateTime);
    PutOptional(j, "publicUpdateTime", post.publicUpdateTime);
    PutOptional(j, "deleteTime", post.deleteTime);
    PutOptional(j, "parentPostId", post.parentPostId);
    PutOptional(j, "rootPostId", post.rootPostId);
    PutOptional(j, "specialMsgType", post.specialMsgType);
    if (!post.emojiIds.empty()) j["emojis"] = post.emojiIds;
    if (!post.attachments.empty()) {
        json arr = json::array();
        for (const auto& a : post.attachments) arr.push_back(EncodeAttachment(a));
        j["attachments"] = arr;
    }
    if (!post.reactions.empty()) {
        json arr = json::array();
        for (const auto& r : post.reactions) arr.push_back(EncodeReaction(r));
        j["reactions"] = arr;
    }
    PutOptional(j, "userName", post.userName);
    PutMisc(j, post.misc);
    return j;
}

domain::Post ArchiveCodec::DecodePost(const json& j) {
    FieldReader r(j, "Post");
    domain::Post p;
    p.id = r.required<std::string>("id");
    p.userId = r.required<std::string>("userId");
    p.createTime = r.required<domain::Timestamp>("createTime");
    p.message = r.required<std::string>("message");
    p.isPinned = r.optional<bool>("isPinned");
    p.updateTime = r.optional<domain::Timestamp>("updateTime");
    p.publicUpdateTime = r.optional<domain::Timestamp>("publicUpdateTime");
    p.deleteTime = r.optional<domain::Timestamp>("deleteTime");
    p.parentPostId = r.optional<std::string>("parentPostId");
    p.rootPostId = r.optional<std::string>("rootPostId");
    p.specialMsgType = r.optional<std::string>("specialMsgType");
    p.emojiIds = r.optional<std::vector<std::string>>("emojis").value_or(std::vector<std::string>{});

    json attachments = r.take("attachments");
    if (attachments.is_array()) {
        for (const auto& a : attachments) p.attachments.push_back(DecodeAttachment(a));
    }
    json reactions = r.take("reactions");
    if (reactions.is_array()) {
        for (const auto& rj : reactions) p.reactions.push_back(DecodeReaction(rj));
    }
    p.userName = r.optional<std::string>("userName");
    p.misc = r.misc();
    return p;
}

json ArchiveCodec::EncodeChannel(const domain::Channel& channel) {
    json j = {{"id", channel.id}, {"internalName", channel.internalName},
              {"type", domain::ChannelTypeToString(channel.type)},
              {"messageCount", channel.messageCount}, {"createTime", channel.createTime}};
    PutOptional(j, "name", channel.name);
    PutOptional(j, "updateTime", channel.updateTime);
    PutOptional(j, "deleteTime", channel.deleteTime);
    PutOptional(j, "creatorUserId", channel.creatorUserId);
    PutOptional(j, "header", channel.header);
    PutOptional(j, "purpose", channel.purpose);
    PutOptional(j, "rootMessageCount", channel.rootMessageCount);
    PutOptional(j, "lastPostTime", channel.lastPostTime);
    PutMisc(j, channel.misc);
    return j;
}

domain::Channel ArchiveCodec::DecodeChannel(const json& j) {
    FieldReader r(j, "Channel");
    domain::Channel c;
    c.id = r.required<std::string>("id");
    c.internalName = r.required<std::string>("internalName");
    std::string type = r.required<std::string>("type");
    auto parsedType = domain::ChannelTypeFromString(type);
    if (!parsedType) {
        Logger::Warning("ArchiveCodec", "Unknown channel type '" + type + "', assumed open.");
    }
    c.type = parsedType.value_or(domain::ChannelType::Open);
    c.messageCount = r.optional<std::int64_t>("messageCount").value_or(0);
    c.createTime = r.required<domain::Timestamp>("createTime");
    c.name = r.optional<std::string>("name");
    c.updateTime = r.optional<domain::Timestamp>("updateTime");
    c.deleteTime = r.optional<domain::Timestamp>("deleteTime");
    c.creatorUserId = r.optional<std::string>("creatorUserId");
    c.header = r.optional<std::string>("header");
    c.purpose = r.optional<std::string>("purpose");
    c.rootMessageCount = r.optional<std::int64_t>("rootMessageCount");
    c.lastPostTime = r.optional<domain::Timestamp>("lastPostTime");
    c.misc = r.misc();
    return c;
}

json ArchiveCodec::EncodeTeam(const domain::Team& team) {
    json j = {{"id", team.id}, {"name", team.name}, {"internalName", team.internalName},
              {"type", domain::TeamTypeToString(team.type)}, {"createTime", team.createTime}};
    PutOptional(j, "updateTime", team.updateTime);
    PutOptional(j, "deleteTime", team.deleteTime);
    PutOptional(j, "description", team.description);
    PutOptional(j, "updateAvatarTime", team.updateAvatarTime);
    PutOptional(j, "inviteId", team.inviteId);
    PutMisc(j, team.misc);
    return j;
}

domain::Team ArchiveCodec::DecodeTeam(const json& j) {
    FieldReader r(j, "Team");
    domain::Team t;
    t.id = r.required<std::string>("id");
    t.name = r.required<std::string>("name");
    t.internalName = r.required<std::string>("internalName");
    std::string type = r.required<std::string>("type");
    t.type = domain::TeamTypeFromString(type).value_or(domain::TeamType::Open);
    t.createTime = r.required<domain::Timestamp>("createTime");
    t.updateTime = r.optional<domain::Timestamp>("updateTime");
    t.deleteTime = r.optional<domain::Timestamp>("deleteTime");
    t.description = r.optional<std::string>("description");
    t.updateAvatarTime = r.optional<domain::Timestamp>("updateAvatarTime");
    t.inviteId = r.optional<std::string>("inviteId");
    t.misc = r.misc();
    return t;
}

json ArchiveCodec::EncodeStorage(const domain::StorageInfo& storage) {
    json j = {{"count", storage.count},
              {"organization", domain::OrderingToString(storage.organization)},
              {"byteSize", storage.byteSize}};
    PutOptional(j, "beginTime", storage.beginTime);
    PutOptional(j, "endTime", storage.endTime);
    PutOptional(j, "firstPostId", storage.firstPostId);
    PutOptional(j, "lastPostId", storage.lastPostId);
    PutOptional(j, "postIdBeforeFirst", storage.postIdBeforeFirst);
    PutOptional(j, "postIdAfterLast", storage.postIdAfterLast);
    PutMisc(j, storage.misc);
    return j;
}

domain::StorageInfo ArchiveCodec::DecodeStorage(const json& j) {
    FieldReader r(j, "Storage");
    domain::StorageInfo s;
    s.count = r.required<std::int64_t>("count");
    std::string organization = r.required<std::string>("organization");
    auto parsed = domain::OrderingFromString(organization);
    if (!parsed) {
        Logger::Warning("ArchiveCodec", "Unknown post organization '" + organization + "', assumed unsorted.");
    }
    s.organization = parsed.value_or(domain::PostOrdering::Unsorted);
    s.byteSize = r.required<std::uint64_t>("byteSize");
    s.beginTime = r.optional<domain::Timestamp>("beginTime");
    s.endTime = r.optional<domain::Timestamp>("endTime");
    s.firstPostId = r.optional<std::string>("firstPostId");
    s.lastPostId = r.optional<std::string>("lastPostId");
    s.postIdBeforeFirst = r.optional<std::string>("postIdBeforeFirst");
    s.postIdAfterLast = r.optional<std::string>("postIdAfterLast");
    s.misc = r.misc();
    if (s.count < 0) {
        throw domain::ArchiveError("Storage record has negative count");
    }
    return s;
}

json ArchiveCodec::EncodeHeader(const domain::ArchiveHeader& header) {
    json j = json::object();
    j["version"] = header.version;
    j["channel"] = EncodeChannel(header.channel);
    if (header.team) {
        j["team"] = EncodeTeam(*header.team);
    }
    if (!header.users.empty()) {
        json arr = json::array();
        for (const auto& u : header.users) arr.push_back(EncodeUser(u));
        j["users"] = arr;
    }
    if (!header.emojis.empty()) {
        json arr = json::array();
        for (const auto& e : header.emojis) arr.push_back(EncodeEmoji(e));
        j["emojis"] = arr;
    }
    j["storage"] = EncodeStorage(header.storage);
    PutMisc(j, header.misc);
    return j;
}

domain::ArchiveHeader ArchiveCodec::DecodeHeader(const json& j) {
    try {
        FieldReader r(j, "Header");
        domain::ArchiveHeader h;

        auto version = r.optional<std::string>("version");
        if (!version) {
            Logger::Warning("ArchiveCodec", "Channel metadata is missing versioning information, some data may be lost.");
        } else if (version->empty() || !std::isdigit(static_cast<unsigned char>((*version)[0]))) {
            Logger::Warning("ArchiveCodec", "Channel metadata has unrecognized version '" + *version + "'.");
        } else if ((*version)[0] != '0') {
            Logger::Warning("ArchiveCodec", "Loading channel from future version " + *version + ", current version is " +
                                                domain::ArchiveHeader::CurrentVersion + ".");
        }
        h.version = domain::ArchiveHeader::CurrentVersion;

        json channel = r.take("channel");
        if (channel.is_null()) {
            throw domain::ArchiveError("Header has no channel record");
        }
        h.channel = DecodeChannel(channel);

        json team = r.take("team");
        if (!team.is_null()) h.team = DecodeTeam(team);

        json users = r.take("users");
        if (users.is_array()) {
            for (const auto& u : users) h.addUser(DecodeUser(u));
        }
        json emojis = r.take("emojis");
        if (emojis.is_array()) {
            for (const auto& e : emojis) h.addEmoji(DecodeEmoji(e));
        }

        json storage = r.take("storage");
        if (storage.is_null()) {
            throw domain::ArchiveError("Header has no storage record");
        }
        h.storage = DecodeStorage(storage);
        h.misc = r.misc();
        return h;
    } catch (const domain::CorruptHeaderError&) {
        throw;
    } catch (const domain::ArchiveError& e) {
        throw domain::CorruptHeaderError(e.what());
    }
}

std::string ArchiveCodec::EncodePostLine(const domain::Post& post) {
    return EncodePost(post).dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

domain::Post ArchiveCodec::DecodePostLine(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        throw domain::ArchiveError(std::string("Post record is not valid JSON: ") + e.what());
    }
    return DecodePost(j);
}

std::string ArchiveCodec::SerializeHeader(const domain::ArchiveHeader& header) {
    return EncodeHeader(header).dump(4, ' ', false, json::error_handler_t::replace);
}

domain::ArchiveHeader ArchiveCodec::ParseHeader(const std::string& content) {
    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw domain::CorruptHeaderError(std::string("Header is not valid JSON: ") + e.what());
    }
    return DecodeHeader(j);
}

} // namespace chatvault::infrastructure

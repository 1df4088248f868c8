/**
 * @file ArchiveCodec.hpp
 * @brief Store-form JSON mapping of archive headers and post records.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/ArchiveHeader.hpp"
#include "domain/Entities.hpp"

namespace chatvault::infrastructure {

/**
 * @class ArchiveCodec
 * @brief Converts domain objects to and from the archive's JSON representation.
 *
 * Store form uses camelCase keys, integer millisecond times and omits absent or empty
 * values. Keys the codec does not know are folded into the entity's `misc` object,
 * so records written by newer versions survive a load/save cycle.
 * Decoding failures throw domain::ArchiveError (domain::CorruptHeaderError for headers).
 */
class ArchiveCodec {
public:
    static nlohmann::json EncodeUser(const domain::User& user);
    static domain::User DecodeUser(const nlohmann::json& j);

    static nlohmann::json EncodeEmoji(const domain::Emoji& emoji);
    static domain::Emoji DecodeEmoji(const nlohmann::json& j);

    static nlohmann::json EncodeAttachment(const domain::FileAttachment& attachment);
    static domain::FileAttachment DecodeAttachment(const nlohmann::json& j);

    static nlohmann::json EncodeReaction(const domain::PostReaction& reaction);
    static domain::PostReaction DecodeReaction(const nlohmann::json& j);

    static nlohmann::json EncodePost(const domain::Post& post);
    static domain::Post DecodePost(const nlohmann::json& j);

    static nlohmann::json EncodeChannel(const domain::Channel& channel);
    static domain::Channel DecodeChannel(const nlohmann::json& j);

    static nlohmann::json EncodeTeam(const domain::Team& team);
    static domain::Team DecodeTeam(const nlohmann::json& j);

    static nlohmann::json EncodeStorage(const domain::StorageInfo& storage);
    static domain::StorageInfo DecodeStorage(const nlohmann::json& j);

    static nlohmann::json EncodeHeader(const domain::ArchiveHeader& header);
    /** @throws domain::CorruptHeaderError on any structural problem. */
    static domain::ArchiveHeader DecodeHeader(const nlohmann::json& j);

    /** @brief One compact line, newline terminated, as written to the data file. */
    static std::string EncodePostLine(const domain::Post& post);
    static domain::Post DecodePostLine(const std::string& line);

    /** @brief Serialized header file content. */
    static std::string SerializeHeader(const domain::ArchiveHeader& header);
    static domain::ArchiveHeader ParseHeader(const std::string& content);
};

} // namespace chatvault::infrastructure

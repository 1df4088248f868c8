/**
 * @file MattermostMapper.hpp
 * @brief Conversion of Mattermost API v4 records into domain entities.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/Entities.hpp"

namespace chatvault::infrastructure {

/**
 * @class MattermostMapper
 * @brief Static mapping functions for server records.
 *
 * Default-looking values (zero delete times, update time equal to creation, empty strings)
 * are normalised away, fields known to be redundant are dropped, and everything else the
 * server sends lands in `misc`.
 * A missing required field throws domain::MalformedRecordError.
 */
class MattermostMapper {
public:
    static domain::User MapUser(const nlohmann::json& info);
    static domain::Emoji MapEmoji(const nlohmann::json& info);
    static domain::FileAttachment MapAttachment(const nlohmann::json& info);
    static domain::PostReaction MapReaction(const nlohmann::json& info);
    static domain::Post MapPost(const nlohmann::json& info);
    static domain::Channel MapChannel(const nlohmann::json& info);
    static domain::Team MapTeam(const nlohmann::json& info);

    /** @brief Server channel type letter ('O', 'P', 'G', 'D'); unknown letters map to Open. */
    static domain::ChannelType MapChannelType(const std::string& letter);
};

} // namespace chatvault::infrastructure

/**
 * @file ChannelSelector.hpp
 * @brief Turns the configured selection into the ordered list of channel jobs.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "application/ChannelSyncService.hpp"
#include "domain/Entities.hpp"
#include "domain/RemoteDirectory.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace chatvault::application {

/**
 * @class ChannelSelector
 * @brief Matches configured users, groups, teams and channels against what the account can see.
 *
 * Jobs are ordered direct conversations first, then group conversations, then team
 * channels. Direct and group conversations are listed by every team but selected once.
 * Entries that match nothing are reported as warnings.
 */
class ChannelSelector {
public:
    ChannelSelector(domain::RemoteDirectory& remote, const infrastructure::AppConfig& config);

    std::vector<ChannelJob> select(const domain::User& localUser);

private:
    using TeamChannels = std::pair<domain::Team, std::vector<domain::Channel>>;

    std::optional<domain::User> findUser(const infrastructure::EntityLocator& locator);
    void selectDirect(const domain::User& me, const std::vector<TeamChannels>& teams, std::vector<ChannelJob>& jobs);
    void selectGroups(const domain::User& me, const std::vector<TeamChannels>& teams, std::vector<ChannelJob>& jobs);
    void selectTeamChannels(const std::vector<TeamChannels>& teams, std::vector<ChannelJob>& jobs);

    domain::RemoteDirectory& m_remote;
    const infrastructure::AppConfig& m_config;
    std::set<std::string> m_selected; ///< Channel ids already turned into jobs.
};

} // namespace chatvault::application

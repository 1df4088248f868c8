/**
 * @file ChannelSelector.cpp
 * @brief Implementation of ChannelSelector.
 */

#include "application/ChannelSelector.hpp"
#include "infrastructure/Logger.hpp"

#include <algorithm>

namespace chatvault::application {

using domain::ChannelType;
using infrastructure::EntityLocator;
using infrastructure::Logger;

namespace {

bool Matches(const EntityLocator& locator, const std::string& id, const std::optional<std::string>& name,
             const std::string& internalName) {
    if (locator.id) return *locator.id == id;
    if (locator.name) return name && *locator.name == *name;
    if (locator.internalName) return *locator.internalName == internalName;
    return false;
}

bool MatchesTeam(const EntityLocator& locator, const domain::Team& team) {
    return Matches(locator, team.id, team.name, team.internalName);
}

bool MatchesChannel(const EntityLocator& locator, const domain::Channel& channel) {
    return Matches(locator, channel.id, channel.name, channel.internalName);
}

/** @brief Other participant of a direct channel named "<id>__<id>". */
std::optional<std::string> OtherUserId(const std::string& internalName, const std::string& localUserId) {
    const auto split = internalName.find("__");
    if (split == std::string::npos) return std::nullopt;
    const std::string first = internalName.substr(0, split);
    const std::string second = internalName.substr(split + 2);
    if (first == localUserId) return second;
    if (second == localUserId) return first;
    return std::nullopt;
}

} // namespace

ChannelSelector::ChannelSelector(domain::RemoteDirectory& remote, const infrastructure::AppConfig& config)
    : m_remote(remote), m_config(config) {}

std::optional<domain::User> ChannelSelector::findUser(const EntityLocator& locator) {
    if (locator.id) return m_remote.findUserById(*locator.id);
    if (locator.name) return m_remote.findUserByName(*locator.name);
    if (locator.internalName) return m_remote.findUserByName(*locator.internalName);
    return std::nullopt;
}

std::vector<ChannelJob> ChannelSelector::select(const domain::User& localUser) {
    m_selected.clear();

    std::vector<TeamChannels> teams;
    for (auto& team : m_remote.listTeams()) {
        std::vector<domain::Channel> channels = m_remote.listChannels(team.id);
        teams.emplace_back(std::move(team), std::move(channels));
    }
    if (teams.empty()) {
        Logger::Error("ChannelSelector", "User " + localUser.name + " is not a member of any team");
        return {};
    }

    std::vector<ChannelJob> jobs;
    selectDirect(localUser, teams, jobs);
    selectGroups(localUser, teams, jobs);
    selectTeamChannels(teams, jobs);
    Logger::Info("ChannelSelector", "Selected " + std::to_string(jobs.size()) + " channels");
    return jobs;
}

void ChannelSelector::selectDirect(const domain::User& me, const std::vector<TeamChannels>& teams,
                                   std::vector<ChannelJob>& jobs) {
    struct Wanted {
        domain::User user;
        const domain::ChannelOptions* options;
        std::string channelName;
        bool matched = false;
    };

    std::vector<Wanted> wanted;
    for (const auto& entry : m_config.users) {
        auto user = findUser(entry.locator);
        if (!user) {
            Logger::Warning("ChannelSelector", "No user found for " + entry.locator.describe());
            continue;
        }
        const bool duplicate = std::any_of(wanted.begin(), wanted.end(),
                                           [&](const Wanted& w) { return w.user.id == user->id; });
        if (duplicate) {
            Logger::Warning("ChannelSelector", "Direct messages with " + user->name + " requested more than once");
            continue;
        }
        std::string channelName = m_remote.directChannelName(me.id, user->id);
        wanted.push_back(Wanted{std::move(*user), &entry.options, std::move(channelName)});
    }

    for (const auto& teamChannels : teams) {
        for (const auto& channel : teamChannels.second) {
            if (channel.type != ChannelType::Direct || m_selected.count(channel.id)) continue;

            auto it = std::find_if(wanted.begin(), wanted.end(),
                                   [&](const Wanted& w) { return w.channelName == channel.internalName; });
            std::optional<domain::User> other;
            const domain::ChannelOptions* options = nullptr;
            if (it != wanted.end()) {
                it->matched = true;
                other = it->user;
                options = it->options;
            } else if (m_config.downloadUserChannels) {
                auto otherId = OtherUserId(channel.internalName, me.id);
                if (!otherId) {
                    Logger::Warning("ChannelSelector", "Cannot tell the participants of direct channel " + channel.id);
                    continue;
                }
                other = *otherId == me.id ? std::optional<domain::User>(me) : m_remote.findUserById(*otherId);
                if (!other) {
                    Logger::Warning("ChannelSelector", "Unknown user " + *otherId + " in direct channel " + channel.id);
                    continue;
                }
                options = &m_config.directDefaults;
            } else {
                continue;
            }

            m_selected.insert(channel.id);
            ChannelJob job;
            job.archiveName = "d." + me.name + "--" + other->name;
            job.channel = channel;
            job.seedUsers = {me};
            if (other->id != me.id) job.seedUsers.push_back(*other);
            job.options = *options;
            jobs.push_back(std::move(job));
        }
    }

    for (const auto& w : wanted) {
        if (!w.matched) {
            Logger::Warning("ChannelSelector", "Found no direct channel with " + w.user.name);
        }
    }
}

void ChannelSelector::selectGroups(const domain::User& me, const std::vector<TeamChannels>& teams,
                                   std::vector<ChannelJob>& jobs) {
    // Member ids of every group entry given by members; unresolvable entries never match.
    std::vector<std::optional<std::set<std::string>>> memberSets;
    for (const auto& entry : m_config.groups) {
        if (entry.channelId) {
            memberSets.emplace_back();
            continue;
        }
        std::set<std::string> ids{me.id};
        bool resolved = true;
        for (const auto& locator : entry.members) {
            auto user = findUser(locator);
            if (!user) {
                Logger::Warning("ChannelSelector", "No user found for group member " + locator.describe());
                resolved = false;
                break;
            }
            ids.insert(user->id);
        }
        memberSets.push_back(resolved ? std::optional<std::set<std::string>>(std::move(ids)) : std::nullopt);
    }
    std::vector<bool> matched(m_config.groups.size(), false);

    for (const auto& teamChannels : teams) {
        for (const auto& channel : teamChannels.second) {
            if (channel.type != ChannelType::Group || m_selected.count(channel.id)) continue;

            std::vector<domain::User> members = m_remote.listChannelMembers(channel.id);
            std::set<std::string> memberIds{me.id};
            for (const auto& member : members) memberIds.insert(member.id);

            const domain::ChannelOptions* options = nullptr;
            for (std::size_t i = 0; i < m_config.groups.size(); ++i) {
                const auto& entry = m_config.groups[i];
                const bool byId = entry.channelId && *entry.channelId == channel.id;
                const bool byMembers = memberSets[i] && *memberSets[i] == memberIds;
                if (byId || byMembers) {
                    matched[i] = true;
                    options = &entry.options;
                    break;
                }
            }
            if (!options) {
                if (!m_config.downloadGroupChannels) continue;
                options = &m_config.groupDefaults;
            }

            std::vector<std::string> names;
            for (const auto& member : members) names.push_back(member.name);
            std::sort(names.begin(), names.end());
            std::string userList;
            for (const auto& name : names) {
                if (!userList.empty()) userList += "-";
                userList += name;
            }
            if (userList.empty()) {
                Logger::Warning("ChannelSelector", "No members for group channel " + channel.id + ", using its id as name");
                userList = channel.id;
            }

            m_selected.insert(channel.id);
            ChannelJob job;
            job.archiveName = "g." + userList;
            job.channel = channel;
            job.seedUsers = members;
            job.options = *options;
            jobs.push_back(std::move(job));
        }
    }

    for (std::size_t i = 0; i < m_config.groups.size(); ++i) {
        if (matched[i]) continue;
        const auto& entry = m_config.groups[i];
        std::string described = entry.channelId ? *entry.channelId : std::string();
        for (const auto& locator : entry.members) {
            described += (described.empty() ? "" : ", ") + locator.describe();
        }
        Logger::Warning("ChannelSelector", "Found no group channel for " + described);
    }
}

void ChannelSelector::selectTeamChannels(const std::vector<TeamChannels>& teams, std::vector<ChannelJob>& jobs) {
    if (!m_config.downloadTeamChannels && m_config.teams.empty()) return;

    std::vector<bool> teamMatched(m_config.teams.size(), false);

    auto addJob = [&](const domain::Team& team, const domain::Channel& channel, const domain::ChannelOptions& options) {
        if (m_selected.count(channel.id)) return;
        m_selected.insert(channel.id);
        ChannelJob job;
        job.archiveName = std::string(channel.type == ChannelType::Private ? "p." : "o.") + team.internalName + "--" +
                          channel.internalName;
        job.channel = channel;
        job.team = team;
        job.options = options;
        jobs.push_back(std::move(job));
    };

    for (const auto& teamChannels : teams) {
        const domain::Team& team = teamChannels.first;
        const std::vector<domain::Channel>& channels = teamChannels.second;
        std::size_t entryIndex = 0;
        while (entryIndex < m_config.teams.size() && !MatchesTeam(m_config.teams[entryIndex].locator, team)) {
            ++entryIndex;
        }

        if (entryIndex == m_config.teams.size()) {
            if (!m_config.downloadTeamChannels) continue;
            for (const auto& channel : channels) {
                if (channel.type == ChannelType::Open) addJob(team, channel, m_config.publicDefaults);
                else if (channel.type == ChannelType::Private) addJob(team, channel, m_config.privateDefaults);
            }
            continue;
        }

        teamMatched[entryIndex] = true;
        const infrastructure::TeamEntry& entry = m_config.teams[entryIndex];
        std::vector<bool> publicMatched(entry.publicChannels.size(), false);
        std::vector<bool> privateMatched(entry.privateChannels.size(), false);

        auto pick = [&](const domain::Channel& channel, const std::vector<infrastructure::ChannelEntry>& explicitEntries,
                        std::vector<bool>& found, bool downloadOthers, const domain::ChannelOptions& defaults) {
            for (std::size_t i = 0; i < explicitEntries.size(); ++i) {
                if (MatchesChannel(explicitEntries[i].locator, channel)) {
                    found[i] = true;
                    addJob(team, channel, explicitEntries[i].options);
                    return;
                }
            }
            if (downloadOthers) addJob(team, channel, defaults);
        };

        for (const auto& channel : channels) {
            if (channel.type == ChannelType::Open) {
                pick(channel, entry.publicChannels, publicMatched, entry.downloadPublicChannels, entry.publicDefaults);
            } else if (channel.type == ChannelType::Private) {
                pick(channel, entry.privateChannels, privateMatched, entry.downloadPrivateChannels, entry.privateDefaults);
            }
        }

        for (std::size_t i = 0; i < publicMatched.size(); ++i) {
            if (!publicMatched[i]) {
                Logger::Warning("ChannelSelector", "Found no public channel on team " + team.internalName + " for " +
                                                       entry.publicChannels[i].locator.describe());
            }
        }
        for (std::size_t i = 0; i < privateMatched.size(); ++i) {
            if (!privateMatched[i]) {
                Logger::Warning("ChannelSelector", "Found no private channel on team " + team.internalName + " for " +
                                                       entry.privateChannels[i].locator.describe());
            }
        }
    }

    for (std::size_t i = 0; i < teamMatched.size(); ++i) {
        if (!teamMatched[i]) {
            Logger::Error("ChannelSelector", "Team requested by " + m_config.teams[i].locator.describe() + " was not found");
        }
    }
}

} // namespace chatvault::application

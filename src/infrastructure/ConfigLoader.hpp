/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the download configuration (chatvault.json).
 *
 * Produces fully resolved per-channel options so the synchronization engine never
 * looks at configuration files or the environment itself.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ChannelOptions.hpp"
#include "infrastructure/Logger.hpp"

namespace chatvault::infrastructure {

/**
 * @struct EntityLocator
 * @brief Identifies a team, channel or user by exactly one of id, display name or internal name.
 */
struct EntityLocator {
    std::optional<std::string> id;
    std::optional<std::string> name;
    std::optional<std::string> internalName;

    std::string describe() const;
};

struct ChannelEntry {
    EntityLocator locator;
    domain::ChannelOptions options;
};

/**
 * @struct GroupEntry
 * @brief Group conversation given either by channel id or by its member list.
 */
struct GroupEntry {
    std::optional<std::string> channelId;
    std::vector<EntityLocator> members;
    domain::ChannelOptions options;
};

struct TeamEntry {
    EntityLocator locator;
    bool downloadPublicChannels = true;
    std::vector<ChannelEntry> publicChannels;
    domain::ChannelOptions publicDefaults;
    bool downloadPrivateChannels = true;
    std::vector<ChannelEntry> privateChannels;
    domain::ChannelOptions privateDefaults;
};

struct ConnectionConfig {
    std::string hostname;
    std::string username;
    std::string password;
    std::string token;
};

struct ThrottlingConfig {
    std::chrono::milliseconds loopDelay{0};
    int retryCount = 3;
    std::chrono::milliseconds retryDelay{5000};
};

/**
 * @struct AppConfig
 * @brief Everything a run needs, after file, environment and validation.
 */
struct AppConfig {
    static constexpr int DefaultBatchSize = 60;
    static constexpr int MaxBatchSize = 200;

    ConnectionConfig connection;
    ThrottlingConfig throttling;
    int batchSize = DefaultBatchSize;

    std::filesystem::path outputDirectory = ".";
    bool humanFriendlyPosts = false;
    LogVerbosity verbosity = LogVerbosity::Normal;
    bool downloadAllEmojis = false;

    bool downloadTeamChannels = true;
    std::vector<TeamEntry> teams;
    bool downloadUserChannels = true;
    std::vector<ChannelEntry> users;
    bool downloadGroupChannels = true;
    std::vector<GroupEntry> groups;

    domain::ChannelOptions directDefaults;
    domain::ChannelOptions groupDefaults;
    domain::ChannelOptions privateDefaults;
    domain::ChannelOptions publicDefaults;
};

class ConfigLoader {
public:
    /**
     * @brief Reads a configuration file, applies environment overrides and validates the result.
     * @throws domain::ConfigurationError
     */
    static AppConfig LoadFile(const std::filesystem::path& configPath);

    /**
     * @brief First existing file of PathUtils::GetConfigCandidates().
     */
    static std::optional<std::filesystem::path> DiscoverConfigFile();

    /** @brief Builds the configuration from a parsed document (no environment, no validation). */
    static AppConfig FromJson(const nlohmann::json& config);

    /** @brief MATTERMOST_SERVER / _USERNAME / _PASSWORD / _TOKEN override the connection block. */
    static void ApplyEnvironment(AppConfig& config);

    /** @brief Checks settings that may come from any source. @throws domain::ConfigurationError */
    static void Validate(const AppConfig& config);

    /**
     * @brief Parses one option block onto the built-in defaults.
     *
     * Blocks are never layered onto each other; the most specific block for a channel wins alone.
     */
    static domain::ChannelOptions ParseChannelOptions(const nlohmann::json& block);
};

} // namespace chatvault::infrastructure

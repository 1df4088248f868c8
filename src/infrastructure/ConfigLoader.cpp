/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include "domain/Time.hpp"
#include "infrastructure/PathUtils.hpp"

#include <cstdlib>
#include <fstream>

namespace chatvault::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kAcceptedVersion = "1";

const char* const kOptionKeys[] = {
    "downloadFromOldest", "afterPost", "beforePost", "afterTime", "beforeTime",
    "maximumPostCount", "sessionPostLimit", "onExistingCompatible", "onExistingIncompatible",
    "repairUncommitted", "attachments", "emojis", "avatars"
};

[[noreturn]] void Fail(const std::string& message) {
    throw domain::ConfigurationError(message);
}

template <typename T>
std::optional<T> Get(const json& block, const char* key, const std::string& where) {
    auto it = block.find(key);
    if (it == block.end() || it->is_null()) {
        return std::nullopt;
    }
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        Fail("'" + where + "." + key + "' has the wrong type");
    }
}

const json* GetObject(const json& block, const char* key, const std::string& where) {
    auto it = block.find(key);
    if (it == block.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        Fail("'" + where + "." + key + "' must be an object");
    }
    return &*it;
}

const json* GetArray(const json& block, const char* key, const std::string& where) {
    auto it = block.find(key);
    if (it == block.end() || it->is_null()) return nullptr;
    if (!it->is_array()) {
        Fail("'" + where + "." + key + "' must be an array");
    }
    return &*it;
}

std::optional<domain::Timestamp> GetTime(const json& block, const char* key, const std::string& where) {
    auto it = block.find(key);
    if (it == block.end() || it->is_null()) return std::nullopt;
    if (it->is_number_integer()) {
        return it->get<domain::Timestamp>();
    }
    if (it->is_string()) {
        auto parsed = domain::ParseIsoTime(it->get<std::string>());
        if (!parsed) {
            Fail("'" + where + "." + key + "' is not a valid ISO-8601 time: " + it->get<std::string>());
        }
        return parsed;
    }
    Fail("'" + where + "." + key + "' must be a millisecond timestamp or an ISO-8601 string");
}

std::int64_t GetLimit(const json& block, const char* key, const std::string& where, std::int64_t fallback) {
    auto value = Get<std::int64_t>(block, key, where);
    if (!value) return fallback;
    if (*value < domain::kUnlimited) {
        Fail("'" + where + "." + key + "' must be -1 (unlimited) or non-negative");
    }
    return *value;
}

bool HasOptionKeys(const json& block) {
    for (const char* key : kOptionKeys) {
        if (block.contains(key)) return true;
    }
    return false;
}

EntityLocator ParseLocator(const json& info, const std::string& where) {
    if (info.is_string()) {
        EntityLocator locator;
        locator.id = info.get<std::string>();
        return locator;
    }
    if (!info.is_object()) {
        Fail("'" + where + "' must be a locator object");
    }
    EntityLocator locator;
    locator.id = Get<std::string>(info, "id", where);
    locator.name = Get<std::string>(info, "name", where);
    locator.internalName = Get<std::string>(info, "internalName", where);
    int count = (locator.id ? 1 : 0) + (locator.name ? 1 : 0) + (locator.internalName ? 1 : 0);
    if (count == 0) {
        Fail("'" + where + "' has no identificator (id, name or internalName)");
    }
    if (count > 1) {
        Fail("'" + where + "' has multiple, possibly conflicting identificators");
    }
    return locator;
}

/** @brief Option block for an explicit entry: its own options if it has any, else the inherited block. */
domain::ChannelOptions EntryOptions(const json& entry, const domain::ChannelOptions& inherited) {
    return HasOptionKeys(entry) ? ConfigLoader::ParseChannelOptions(entry) : inherited;
}

/** @brief First present block among @p keys of @p scope, parsed; else @p inherited. */
domain::ChannelOptions MostSpecific(const json& scope,
                                    std::initializer_list<const char*> keys,
                                    const domain::ChannelOptions& inherited,
                                    const std::string& where) {
    for (const char* key : keys) {
        if (const json* block = GetObject(scope, key, where)) {
            return ConfigLoader::ParseChannelOptions(*block);
        }
    }
    return inherited;
}

std::vector<ChannelEntry> ParseChannelEntries(const json* list,
                                              const domain::ChannelOptions& inherited,
                                              const std::string& where) {
    std::vector<ChannelEntry> entries;
    if (!list) return entries;
    std::size_t index = 0;
    for (const auto& item : *list) {
        std::string itemWhere = where + "[" + std::to_string(index++) + "]";
        ChannelEntry entry;
        entry.locator = ParseLocator(item, itemWhere);
        entry.options = item.is_object() ? EntryOptions(item, inherited) : inherited;
        entries.push_back(entry);
    }
    return entries;
}

} // namespace

std::string EntityLocator::describe() const {
    if (id) return "id '" + *id + "'";
    if (name) return "name '" + *name + "'";
    if (internalName) return "internal name '" + *internalName + "'";
    return "<empty locator>";
}

domain::ChannelOptions ConfigLoader::ParseChannelOptions(const json& block) {
    const std::string where = "channelOptions";
    if (!block.is_object()) {
        Fail("Channel option block must be an object");
    }

    domain::ChannelOptions opts;
    if (auto fromOldest = Get<bool>(block, "downloadFromOldest", where)) {
        opts.bounds.direction = *fromOldest ? domain::OrderDirection::Asc : domain::OrderDirection::Desc;
    }
    opts.bounds.afterPost = Get<std::string>(block, "afterPost", where);
    opts.bounds.beforePost = Get<std::string>(block, "beforePost", where);
    opts.bounds.afterTime = GetTime(block, "afterTime", where);
    opts.bounds.beforeTime = GetTime(block, "beforeTime", where);
    if (opts.bounds.afterTime && opts.bounds.beforeTime && *opts.bounds.afterTime >= *opts.bounds.beforeTime) {
        Logger::Warning("ConfigLoader", "afterTime is not before beforeTime; such channels receive no posts.");
    }

    opts.maximumPostCount = GetLimit(block, "maximumPostCount", where, opts.maximumPostCount);
    opts.sessionPostLimit = GetLimit(block, "sessionPostLimit", where, opts.sessionPostLimit);

    if (auto value = Get<std::string>(block, "onExistingCompatible", where)) {
        auto action = domain::ArchiveActionFromString(*value);
        if (!action) {
            Fail("Unknown onExistingCompatible action '" + *value + "'");
        }
        opts.onExistingCompatible = *action;
    }
    if (auto value = Get<std::string>(block, "onExistingIncompatible", where)) {
        auto action = domain::ArchiveActionFromString(*value);
        if (!action || *action == domain::ArchiveAction::Update) {
            Fail("Unknown onExistingIncompatible action '" + *value + "' (backup, delete or skip)");
        }
        opts.onExistingIncompatible = *action;
    }
    opts.repairUncommitted = Get<bool>(block, "repairUncommitted", where).value_or(false);

    if (const json* attachments = GetObject(block, "attachments", where)) {
        opts.attachments.download = Get<bool>(*attachments, "download", where + ".attachments").value_or(false);
        opts.attachments.maxSize = Get<std::int64_t>(*attachments, "maxSize", where + ".attachments").value_or(0);
        if (opts.attachments.maxSize < 0) {
            Fail("'attachments.maxSize' must be non-negative");
        }
        opts.attachments.allowedMimeTypes =
            Get<std::vector<std::string>>(*attachments, "allowedMimeTypes", where + ".attachments").value_or(std::vector<std::string>{});
    }
    if (const json* emojis = GetObject(block, "emojis", where)) {
        opts.downloadEmoji = Get<bool>(*emojis, "download", where + ".emojis").value_or(false);
        opts.emojiMetadata = Get<bool>(*emojis, "metadata", where + ".emojis").value_or(false);
    }
    if (const json* avatars = GetObject(block, "avatars", where)) {
        opts.downloadAvatars = Get<bool>(*avatars, "download", where + ".avatars").value_or(false);
    }
    return opts;
}

AppConfig ConfigLoader::FromJson(const json& config) {
    if (!config.is_object()) {
        Fail("Configuration must be a JSON object");
    }

    auto version = Get<std::string>(config, "version", "config");
    if (!version) {
        Logger::Warning("ConfigLoader", "Configuration has no version, assuming " + std::string(kAcceptedVersion) + ".");
    } else if (*version != kAcceptedVersion) {
        Fail("Unsupported configuration version '" + *version + "', expected " + kAcceptedVersion);
    }

    AppConfig cfg;

    if (const json* connection = GetObject(config, "connection", "config")) {
        cfg.connection.hostname = Get<std::string>(*connection, "hostname", "connection").value_or("");
        cfg.connection.username = Get<std::string>(*connection, "username", "connection").value_or("");
        cfg.connection.password = Get<std::string>(*connection, "password", "connection").value_or("");
        cfg.connection.token = Get<std::string>(*connection, "token", "connection").value_or("");
    }

    if (const json* throttling = GetObject(config, "throttling", "config")) {
        cfg.throttling.loopDelay = std::chrono::milliseconds(
            Get<std::int64_t>(*throttling, "loopDelay", "throttling").value_or(0));
        cfg.throttling.retryCount = Get<int>(*throttling, "retryCount", "throttling").value_or(cfg.throttling.retryCount);
        cfg.throttling.retryDelay = std::chrono::milliseconds(
            Get<std::int64_t>(*throttling, "retryDelay", "throttling").value_or(cfg.throttling.retryDelay.count()));
    }
    cfg.batchSize = Get<int>(config, "batchSize", "config").value_or(AppConfig::DefaultBatchSize);

    if (const json* output = GetObject(config, "output", "config")) {
        if (auto dir = Get<std::string>(*output, "directory", "output")) {
            cfg.outputDirectory = *dir;
        }
        cfg.humanFriendlyPosts = Get<bool>(*output, "humanFriendlyPosts", "output").value_or(false);
    }

    if (const json* report = GetObject(config, "report", "config")) {
        if (auto level = Get<int>(*report, "verbosity", "report")) {
            switch (*level) {
                case 0: cfg.verbosity = LogVerbosity::ProblemsOnly; break;
                case 1: cfg.verbosity = LogVerbosity::Normal; break;
                case 2: cfg.verbosity = LogVerbosity::Verbose; break;
                default: Fail("'report.verbosity' must be 0, 1 or 2");
            }
        }
    }
    cfg.downloadAllEmojis = Get<bool>(config, "downloadEmojis", "config").value_or(false);

    // Global blocks: type block, else defaultChannelOptions, else built-in defaults.
    const domain::ChannelOptions builtIn;
    const domain::ChannelOptions globalDefault = MostSpecific(config, {"defaultChannelOptions"}, builtIn, "config");
    cfg.directDefaults = MostSpecific(config, {"userChannelOptions"}, globalDefault, "config");
    cfg.groupDefaults = MostSpecific(config, {"groupChannelOptions"}, globalDefault, "config");
    cfg.privateDefaults = MostSpecific(config, {"privateChannelOptions"}, globalDefault, "config");
    cfg.publicDefaults = MostSpecific(config, {"publicChannelOptions"}, globalDefault, "config");

    cfg.downloadTeamChannels = Get<bool>(config, "downloadTeamChannels", "config").value_or(true);
    if (const json* teams = GetArray(config, "teams", "config")) {
        std::size_t index = 0;
        for (const auto& info : *teams) {
            std::string where = "teams[" + std::to_string(index++) + "]";
            if (!info.is_object() || !info.contains("team")) {
                Fail("'" + where + "' must be an object with a 'team' locator");
            }
            TeamEntry team;
            team.locator = ParseLocator(info["team"], where + ".team");
            team.publicDefaults = MostSpecific(info, {"publicChannelOptions", "defaultChannelOptions"}, cfg.publicDefaults, where);
            team.privateDefaults = MostSpecific(info, {"privateChannelOptions", "defaultChannelOptions"}, cfg.privateDefaults, where);
            team.downloadPublicChannels = Get<bool>(info, "downloadPublicChannels", where).value_or(true);
            team.downloadPrivateChannels = Get<bool>(info, "downloadPrivateChannels", where).value_or(true);
            team.publicChannels = ParseChannelEntries(GetArray(info, "publicChannels", where), team.publicDefaults,
                                                      where + ".publicChannels");
            team.privateChannels = ParseChannelEntries(GetArray(info, "privateChannels", where), team.privateDefaults,
                                                       where + ".privateChannels");
            cfg.teams.push_back(team);
        }
    }

    cfg.downloadUserChannels = Get<bool>(config, "downloadUserChannels", "config").value_or(true);
    cfg.users = ParseChannelEntries(GetArray(config, "users", "config"), cfg.directDefaults, "users");

    cfg.downloadGroupChannels = Get<bool>(config, "downloadGroupChannels", "config").value_or(true);
    if (const json* groups = GetArray(config, "groups", "config")) {
        std::size_t index = 0;
        for (const auto& info : *groups) {
            std::string where = "groups[" + std::to_string(index++) + "]";
            if (!info.is_object() || !info.contains("group")) {
                Fail("'" + where + "' must be an object with a 'group' entry");
            }
            GroupEntry group;
            const json& locator = info["group"];
            if (locator.is_string()) {
                group.channelId = locator.get<std::string>();
            } else if (locator.is_array() && !locator.empty()) {
                std::size_t memberIndex = 0;
                for (const auto& member : locator) {
                    group.members.push_back(ParseLocator(member, where + ".group[" + std::to_string(memberIndex++) + "]"));
                }
            } else {
                Fail("'" + where + ".group' must be a channel id or a non-empty list of user locators");
            }
            group.options = EntryOptions(info, cfg.groupDefaults);
            cfg.groups.push_back(group);
        }
    }

    return cfg;
}

void ConfigLoader::ApplyEnvironment(AppConfig& config) {
    auto apply = [](const char* name, std::string& target) {
        const char* value = std::getenv(name);
        if (value) {
            target = value;
        }
    };
    apply("MATTERMOST_SERVER", config.connection.hostname);
    apply("MATTERMOST_USERNAME", config.connection.username);
    apply("MATTERMOST_PASSWORD", config.connection.password);
    apply("MATTERMOST_TOKEN", config.connection.token);
}

void ConfigLoader::Validate(const AppConfig& config) {
    if (config.connection.hostname.empty()) {
        Fail("Required property 'hostname' was not specified in config file nor in the environment");
    }
    if (config.connection.username.empty() && config.connection.token.empty()) {
        Fail("Either 'username' or 'token' must be specified");
    }
    if (config.connection.token.empty() && config.connection.password.empty()) {
        Fail("Either 'password' or 'token' must be specified");
    }
    if (config.batchSize < 1 || config.batchSize > AppConfig::MaxBatchSize) {
        Fail("'batchSize' must be between 1 and " + std::to_string(AppConfig::MaxBatchSize));
    }
    if (config.throttling.retryCount < 0) {
        Fail("'throttling.retryCount' must be non-negative");
    }
    if (config.throttling.loopDelay.count() < 0 || config.throttling.retryDelay.count() < 0) {
        Fail("Throttling delays must be non-negative");
    }
}

std::optional<fs::path> ConfigLoader::DiscoverConfigFile() {
    for (const auto& candidate : PathUtils::GetConfigCandidates()) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

AppConfig ConfigLoader::LoadFile(const fs::path& configPath) {
    std::ifstream f(configPath);
    if (!f.is_open()) {
        Fail("Cannot open configuration file '" + configPath.string() + "'");
    }
    if (configPath.extension() != ".json") {
        Logger::Warning("ConfigLoader", "Unrecognized configuration suffix '" + configPath.extension().string() +
                                            "', assuming json.");
    }

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        Fail("Failed to parse configuration file '" + configPath.string() + "': " + e.what());
    }

    AppConfig config = FromJson(j);
    ApplyEnvironment(config);
    Validate(config);
    Logger::Debug("ConfigLoader", "Loaded configuration from " + configPath.string());
    return config;
}

} // namespace chatvault::infrastructure

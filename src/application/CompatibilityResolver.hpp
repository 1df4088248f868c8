/**
 * @file CompatibilityResolver.hpp
 * @brief Decides how an existing archive relates to a new download request.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include "domain/ArchiveHeader.hpp"
#include "domain/ChannelOptions.hpp"
#include "domain/Entities.hpp"
#include "domain/SyncTypes.hpp"

namespace chatvault::application {

/**
 * @struct Resolution
 * @brief Chosen action plus the bounds the planner must use to carry it out.
 */
struct Resolution {
    domain::CompatibilityAction action = domain::CompatibilityAction::Skip;
    std::string reason;
    domain::FetchBounds bounds; ///< For Append the cursor bound is moved to the archive edge.
};

/**
 * @class CompatibilityResolver
 * @brief Implements the archive compatibility decision table.
 *
 * An archive can only be extended when it is continuous, grows in the requested
 * direction, and the request's fixed bounds do not open a hole between the stored
 * range and the posts still to fetch. Everything else is incompatible and handled by
 * the channel's onExistingIncompatible action.
 */
class CompatibilityResolver {
public:
    /** @brief Creation time of a post, std::nullopt if it does not exist. */
    using PostTimeLookup = std::function<std::optional<domain::Timestamp>(const std::string& postId)>;

    explicit CompatibilityResolver(PostTimeLookup lookup);

    /**
     * @param existing Loaded header, std::nullopt when there is no archive.
     * @param options Resolved per-channel request.
     * @param channel Current channel metadata (used for the up-to-date shortcut).
     */
    Resolution resolve(const std::optional<domain::ArchiveHeader>& existing,
                       const domain::ChannelOptions& options,
                       const domain::Channel& channel) const;

    /** @brief Decision for an archive that exists but cannot be loaded or trusted. */
    Resolution resolveUnusable(const domain::ChannelOptions& options, const std::string& problem) const;

private:
    Resolution incompatible(const domain::ChannelOptions& options, const std::string& reason) const;
    Resolution appendAscending(const domain::StorageInfo& storage, const domain::ChannelOptions& options,
                               const domain::Channel& channel) const;
    Resolution appendDescending(const domain::StorageInfo& storage, const domain::ChannelOptions& options) const;

    PostTimeLookup m_lookup;
};

} // namespace chatvault::application

/**
 * @file CompatibilityResolver.cpp
 * @brief Implementation of CompatibilityResolver.
 */

#include "application/CompatibilityResolver.hpp"

#include <algorithm>

namespace chatvault::application {

using domain::CompatibilityAction;
using domain::Timestamp;

namespace {

Resolution Make(CompatibilityAction action, std::string reason, const domain::FetchBounds& bounds) {
    Resolution r;
    r.action = action;
    r.reason = std::move(reason);
    r.bounds = bounds;
    return r;
}

bool LimitsSkip(const domain::ChannelOptions& options) {
    return options.maximumPostCount == 0 || options.sessionPostLimit == 0;
}

} // namespace

CompatibilityResolver::CompatibilityResolver(PostTimeLookup lookup) : m_lookup(std::move(lookup)) {}

Resolution CompatibilityResolver::incompatible(const domain::ChannelOptions& options, const std::string& reason) const {
    switch (options.onExistingIncompatible) {
        case domain::ArchiveAction::Skip:
            return Make(CompatibilityAction::Skip, "incompatible archive left untouched: " + reason, options.bounds);
        case domain::ArchiveAction::Delete:
            return Make(CompatibilityAction::RebuildWithDelete, reason, options.bounds);
        case domain::ArchiveAction::Backup:
        case domain::ArchiveAction::Update:
        default:
            return Make(CompatibilityAction::RebuildWithBackup, reason, options.bounds);
    }
}

Resolution CompatibilityResolver::resolveUnusable(const domain::ChannelOptions& options, const std::string& problem) const {
    if (LimitsSkip(options)) {
        return Make(CompatibilityAction::Skip, "post limit is zero", options.bounds);
    }
    return incompatible(options, problem);
}

Resolution CompatibilityResolver::resolve(const std::optional<domain::ArchiveHeader>& existing,
                                          const domain::ChannelOptions& options,
                                          const domain::Channel& channel) const {
    if (LimitsSkip(options)) {
        return Make(CompatibilityAction::Skip, "post limit is zero", options.bounds);
    }
    if (!existing) {
        return Make(CompatibilityAction::Fresh, "no archive yet", options.bounds);
    }

    const domain::StorageInfo& storage = existing->storage;
    if (!domain::IsContinuous(storage.organization)) {
        return incompatible(options, "archive organization " + domain::OrderingToString(storage.organization) +
                                         " cannot be extended");
    }
    if (domain::GrowthDirection(storage.organization) != options.bounds.direction) {
        return incompatible(options, "archive grows in the other direction");
    }
    if (storage.count == 0) {
        return Make(CompatibilityAction::Append, "archive is empty", options.bounds);
    }
    if (!storage.lastPostId || !storage.firstPostId || !storage.beginTime || !storage.endTime) {
        return incompatible(options, "archive storage description is incomplete");
    }

    return options.bounds.direction == domain::OrderDirection::Asc
        ? appendAscending(storage, options, channel)
        : appendDescending(storage, options);
}

Resolution CompatibilityResolver::appendAscending(const domain::StorageInfo& storage,
                                                  const domain::ChannelOptions& options,
                                                  const domain::Channel& channel) const {
    const domain::FetchBounds& bounds = options.bounds;
    const Timestamp begin = *storage.beginTime;
    const Timestamp end = *storage.endTime;

    std::optional<Timestamp> after = bounds.afterTime;
    if (bounds.afterPost) {
        std::optional<Timestamp> postTime;
        if (*bounds.afterPost == *storage.lastPostId) {
            postTime = end;
        } else if (*bounds.afterPost == *storage.firstPostId) {
            postTime = begin;
        } else {
            postTime = m_lookup(*bounds.afterPost);
        }
        if (!postTime) {
            return incompatible(options, "afterPost " + *bounds.afterPost + " does not exist");
        }
        after = after ? std::max(*after, *postTime) : *postTime;
    }
    if (after && *after > end) {
        return incompatible(options, "requested range starts after the archived range ends");
    }
    if (after && *after < begin && storage.postIdBeforeFirst) {
        return incompatible(options, "requested range starts before the archived range");
    }

    if (bounds.beforePost) {
        if (*bounds.beforePost == *storage.firstPostId || *bounds.beforePost == *storage.lastPostId) {
            return Make(CompatibilityAction::Skip, "archive already reaches beforePost", bounds);
        }
        auto postTime = m_lookup(*bounds.beforePost);
        if (!postTime) {
            return incompatible(options, "beforePost " + *bounds.beforePost + " does not exist");
        }
        if (*postTime <= end) {
            return Make(CompatibilityAction::Skip, "archive already reaches beforePost", bounds);
        }
    }
    if (bounds.beforeTime && *bounds.beforeTime <= end) {
        return Make(CompatibilityAction::Skip, "archive already reaches beforeTime", bounds);
    }
    if (channel.lastPostTime && *channel.lastPostTime <= end) {
        return Make(CompatibilityAction::Skip, "archive is up to date", bounds);
    }

    Resolution r = Make(CompatibilityAction::Append, "continuing after post " + *storage.lastPostId, bounds);
    r.bounds.afterPost = storage.lastPostId;
    return r;
}

Resolution CompatibilityResolver::appendDescending(const domain::StorageInfo& storage,
                                                   const domain::ChannelOptions& options) const {
    const domain::FetchBounds& bounds = options.bounds;
    // Storage order is newest first: beginTime is the newest post, endTime the oldest.
    const Timestamp newest = *storage.beginTime;
    const Timestamp oldest = *storage.endTime;

    std::optional<Timestamp> before = bounds.beforeTime;
    if (bounds.beforePost) {
        std::optional<Timestamp> postTime;
        if (*bounds.beforePost == *storage.lastPostId) {
            postTime = oldest;
        } else if (*bounds.beforePost == *storage.firstPostId) {
            postTime = newest;
        } else {
            postTime = m_lookup(*bounds.beforePost);
        }
        if (!postTime) {
            return incompatible(options, "beforePost " + *bounds.beforePost + " does not exist");
        }
        before = before ? std::min(*before, *postTime) : *postTime;
    }
    if (before && *before < oldest) {
        return incompatible(options, "requested range starts before the archived range ends");
    }
    if (before && *before > newest && storage.postIdBeforeFirst) {
        return incompatible(options, "requested range starts after the archived range");
    }

    if (bounds.afterPost) {
        if (*bounds.afterPost == *storage.firstPostId || *bounds.afterPost == *storage.lastPostId) {
            return Make(CompatibilityAction::Skip, "archive already reaches afterPost", bounds);
        }
        auto postTime = m_lookup(*bounds.afterPost);
        if (!postTime) {
            return incompatible(options, "afterPost " + *bounds.afterPost + " does not exist");
        }
        if (*postTime >= oldest) {
            return Make(CompatibilityAction::Skip, "archive already reaches afterPost", bounds);
        }
    }
    if (bounds.afterTime && *bounds.afterTime >= oldest) {
        return Make(CompatibilityAction::Skip, "archive already reaches afterTime", bounds);
    }
    if (!storage.postIdAfterLast) {
        return Make(CompatibilityAction::Skip, "archive reaches the beginning of the channel", bounds);
    }

    Resolution r = Make(CompatibilityAction::Append, "continuing before post " + *storage.lastPostId, bounds);
    r.bounds.beforePost = storage.lastPostId;
    return r;
}

} // namespace chatvault::application

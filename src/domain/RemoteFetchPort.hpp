/**
 * @file RemoteFetchPort.hpp
 * @brief Interface through which the synchronization engine pulls posts.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/ChannelOptions.hpp"
#include "domain/Entities.hpp"
#include "domain/SyncTypes.hpp"

namespace chatvault::domain {

/**
 * @class RemoteFetchPort
 * @brief Capability to fetch bounded, ordered batches of channel posts.
 *
 * Implementations throw TransportFailure for retryable problems and AuthFailure when
 * credentials are rejected. Records missing required fields are dropped from pages
 * and counted in PostPage::malformedCount.
 */
class RemoteFetchPort {
public:
    virtual ~RemoteFetchPort() = default;

    /**
     * @brief Whether an ascending scan can start from the channel's oldest post without a cursor.
     *
     * When false, the planner first walks the history newest-to-oldest to find the start.
     */
    virtual bool supportsReverseCursor() const = 0;

    /**
     * @brief Fetches the page adjacent to the cursor.
     * @param channelId Channel to read.
     * @param cursor Exclusive boundary post; std::nullopt starts at the channel edge
     *               (newest for Desc, oldest for Asc).
     * @param direction Direction of travel; the page is ordered accordingly.
     * @param batchSize Upper bound on the number of posts returned.
     */
    virtual PostPage fetchPosts(const std::string& channelId,
                                const std::optional<std::string>& cursor,
                                OrderDirection direction,
                                int batchSize) = 0;

    /** @brief Loads a single post, used to translate post-id bounds into times. */
    virtual std::optional<Post> fetchPost(const std::string& postId) = 0;

    /** @brief Loads a user referenced by a post. */
    virtual std::optional<User> fetchUser(const std::string& userId) = 0;
};

} // namespace chatvault::domain

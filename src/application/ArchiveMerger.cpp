/**
 * @file ArchiveMerger.cpp
 * @brief Implementation of ArchiveMerger.
 */

#include "application/ArchiveMerger.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"

#include <algorithm>

namespace chatvault::application {

using domain::OrderDirection;
using domain::PostOrdering;
using infrastructure::Logger;

ArchiveMerger::ArchiveMerger(infrastructure::ArchiveStore& store,
                             domain::RemoteFetchPort& remote,
                             domain::ArchiveHeader header,
                             infrastructure::RebuildMode pendingRebuild,
                             bool appending,
                             MergeSettings settings)
    : m_store(store),
      m_remote(remote),
      m_header(std::move(header)),
      m_pendingRebuild(pendingRebuild),
      m_onDisk(appending),
      m_settings(settings) {}

void ArchiveMerger::resolveUsers(std::vector<domain::Post>& posts) {
    auto resolve = [this](const std::string& userId) -> const domain::User* {
        if (userId.empty()) return nullptr;
        if (const domain::User* known = m_header.findUser(userId)) return known;
        if (m_unresolvedUsers.count(userId)) return nullptr;

        std::optional<domain::User> user;
        try {
            user = m_remote.fetchUser(userId);
        } catch (const domain::TransportFailure& e) {
            Logger::Warning("ArchiveMerger", "Cannot load user " + userId + ": " + e.what());
        } catch (const domain::RemoteRequestError& e) {
            Logger::Warning("ArchiveMerger", "Cannot load user " + userId + ": " + e.what());
        }
        if (!user) {
            m_unresolvedUsers.insert(userId);
            return nullptr;
        }
        m_header.addUser(*user);
        return m_header.findUser(userId);
    };

    for (auto& post : posts) {
        const domain::User* author = resolve(post.userId);
        if (m_settings.humanFriendly && author) {
            post.userName = author->name;
        }
        for (auto& reaction : post.reactions) {
            const domain::User* reactor = resolve(reaction.userId);
            if (m_settings.humanFriendly && reactor) {
                reaction.userName = reactor->name;
            }
        }
    }
}

void ArchiveMerger::collectEmojis(std::vector<domain::Post>& posts) {
    for (auto& post : posts) {
        if (m_settings.keepEmojis) {
            for (const auto& emoji : post.embeddedEmojis) {
                m_header.addEmoji(emoji);
            }
        } else {
            post.emojiIds.clear();
        }
        post.embeddedEmojis.clear();
    }
}

void ArchiveMerger::describeFirstBatch(const domain::PostBatch& batch) {
    domain::StorageInfo& storage = m_header.storage;
    const domain::Post& front = batch.posts.front();

    const PostOrdering continuous = domain::ContinuousOrderingFor(m_settings.direction);
    storage.organization = batch.contiguous ? continuous : domain::WithoutContinuity(continuous);

    storage.beginTime = front.createTime;
    if (m_settings.direction == OrderDirection::Asc && m_settings.afterTime) {
        storage.beginTime = std::min(*storage.beginTime, *m_settings.afterTime);
    } else if (m_settings.direction == OrderDirection::Desc && m_settings.beforeTime) {
        storage.beginTime = std::max(*storage.beginTime, *m_settings.beforeTime);
    }
    storage.firstPostId = front.id;
    storage.postIdBeforeFirst = batch.anchorPostId;
}

void ArchiveMerger::extendDescription(const domain::PostBatch& batch) {
    domain::StorageInfo& storage = m_header.storage;
    const bool connected = (batch.anchorPostId && batch.anchorPostId == storage.lastPostId) ||
                           (storage.postIdAfterLast && batch.posts.front().id == *storage.postIdAfterLast);
    if (!connected || !batch.contiguous) {
        if (domain::IsContinuous(storage.organization)) {
            Logger::Warning("ArchiveMerger", "Archive " + m_store.archiveName() +
                                                 " has a gap, it is no longer marked continuous");
        }
        storage.organization = domain::WithoutContinuity(storage.organization);
    }
}

void ArchiveMerger::consume(domain::PostBatch batch) {
    if (batch.posts.empty()) return;

    resolveUsers(batch.posts);
    collectEmojis(batch.posts);

    if (!m_onDisk || m_header.storage.count == 0) {
        describeFirstBatch(batch);
    } else {
        extendDescription(batch);
    }

    domain::StorageInfo& storage = m_header.storage;
    storage.lastPostId = batch.posts.back().id;
    storage.endTime = batch.posts.back().createTime;
    storage.postIdAfterLast = batch.followingPostId;

    if (!m_onDisk) {
        m_backupPath = m_store.rebuild(m_pendingRebuild, m_header, batch.posts);
        m_onDisk = true;
        if (m_backupPath) {
            Logger::Info("ArchiveMerger", "Previous archive kept as " + m_backupPath->string());
        }
    } else {
        m_store.append(batch.posts, m_header);
    }

    m_written.insert(m_written.end(), batch.posts.begin(), batch.posts.end());
    Logger::Debug("ArchiveMerger", m_store.archiveName() + ": stored " + std::to_string(batch.posts.size()) +
                                       " posts, " + std::to_string(storage.count) + " in total");
}

void ArchiveMerger::finish(domain::StopReason reason) {
    if (m_onDisk || !domain::IsOrderlyStop(reason)) return;

    domain::StorageInfo& storage = m_header.storage;
    storage.organization = domain::ContinuousOrderingFor(m_settings.direction);
    storage.beginTime.reset();
    storage.endTime.reset();
    storage.firstPostId.reset();
    storage.lastPostId.reset();
    storage.postIdBeforeFirst.reset();
    storage.postIdAfterLast.reset();

    m_backupPath = m_store.rebuild(m_pendingRebuild, m_header, {});
    m_onDisk = true;
}

} // namespace chatvault::application

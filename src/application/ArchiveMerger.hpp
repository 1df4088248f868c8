/**
 * @file ArchiveMerger.hpp
 * @brief Writes planner batches into an archive and keeps its storage description exact.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "domain/ArchiveHeader.hpp"
#include "domain/RemoteFetchPort.hpp"
#include "domain/SyncTypes.hpp"
#include "infrastructure/ArchiveStore.hpp"

namespace chatvault::application {

/**
 * @struct MergeSettings
 * @brief Per-channel options that shape what the merger stores.
 */
struct MergeSettings {
    domain::OrderDirection direction = domain::OrderDirection::Asc;
    std::optional<domain::Timestamp> afterTime;
    std::optional<domain::Timestamp> beforeTime;
    bool keepEmojis = false;     ///< Store emoji references and their metadata.
    bool humanFriendly = false;  ///< Add redundant user names to posts and reactions.
};

/**
 * @class ArchiveMerger
 * @brief Consumes post batches and persists them, one durable append per batch.
 *
 * A fresh or rebuilt archive is only created on disk when the first batch arrives,
 * or at finish() when the run ended cleanly without posts. An existing archive that
 * receives nothing is left byte-for-byte untouched.
 */
class ArchiveMerger {
public:
    /**
     * @param store Locked store of the archive.
     * @param remote Used to resolve users referenced by posts.
     * @param header Header to write; for an append it is the loaded header.
     * @param pendingRebuild How to treat existing files when the archive is (re)created.
     * @param appending True when @p header describes an archive already on disk.
     */
    ArchiveMerger(infrastructure::ArchiveStore& store,
                  domain::RemoteFetchPort& remote,
                  domain::ArchiveHeader header,
                  infrastructure::RebuildMode pendingRebuild,
                  bool appending,
                  MergeSettings settings);

    /** @brief Persists one batch. @throws domain::ArchiveError, domain::AuthFailure */
    void consume(domain::PostBatch batch);

    /** @brief Creates an empty archive when a fresh run ended cleanly without posts. */
    void finish(domain::StopReason reason);

    const domain::ArchiveHeader& header() const { return m_header; }
    domain::ArchiveHeader& header() { return m_header; }

    /** @brief True once the pair exists on disk (loaded or written by this merger). */
    bool onDisk() const { return m_onDisk; }

    std::size_t postsWritten() const { return m_written.size(); }

    /** @brief Every post written during this run, in storage order. */
    const std::vector<domain::Post>& writtenPosts() const { return m_written; }

    /** @brief Backup base path when the old pair was renamed. */
    const std::optional<std::filesystem::path>& backupPath() const { return m_backupPath; }

private:
    void resolveUsers(std::vector<domain::Post>& posts);
    void collectEmojis(std::vector<domain::Post>& posts);
    void describeFirstBatch(const domain::PostBatch& batch);
    void extendDescription(const domain::PostBatch& batch);

    infrastructure::ArchiveStore& m_store;
    domain::RemoteFetchPort& m_remote;
    domain::ArchiveHeader m_header;
    infrastructure::RebuildMode m_pendingRebuild;
    bool m_onDisk;
    MergeSettings m_settings;
    std::vector<domain::Post> m_written;
    std::set<std::string> m_unresolvedUsers;
    std::optional<std::filesystem::path> m_backupPath;
};

} // namespace chatvault::application

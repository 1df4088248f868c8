/**
 * @file ArchiveStore.hpp
 * @brief On-disk representation of one channel archive (header file + post data file).
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "domain/ArchiveHeader.hpp"
#include "domain/Entities.hpp"
#include "infrastructure/ArchiveLock.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace chatvault::infrastructure {

/**
 * @enum RebuildMode
 * @brief What happens to an existing pair before a fresh one is created.
 */
enum class RebuildMode {
    None,    ///< Nothing exists (or nothing must be kept).
    Backup,  ///< Rename the existing pair with a backup marker.
    Discard  ///< Delete the existing pair.
};

/**
 * @class ArchiveStore
 * @brief Owns `<name>.meta.json` (header) and `<name>.data.json` (one post per line).
 *
 * The data file is always written before the header, and the header records the data
 * file size it was written against. A header whose `byteSize` disagrees with the real
 * file is reported as domain::DesynchronizedError and never appended to.
 */
class ArchiveStore {
public:
    ArchiveStore(std::filesystem::path directory, std::string archiveName, PersistenceService& persistence);

    /** @brief Takes the exclusive archive lock. @throws domain::ArchiveLockedError */
    void lock();

    /** @brief Releases the lock. Every write has already been synced when it returned. */
    void close();

    /** @brief Whether a header or a data file exists. */
    bool exists() const;

    /**
     * @brief Loads and validates the header.
     * @return std::nullopt when no archive exists.
     * @throws domain::DesynchronizedError when `byteSize` differs from the data file size.
     * @throws domain::CorruptHeaderError when the header cannot be loaded, or a data file has no header.
     */
    std::optional<domain::ArchiveHeader> open();

    /**
     * @brief Creates an empty pair. Storage count and byteSize of @p header are reset;
     *        the header written to disk carries no post ids or times.
     */
    void create(domain::ArchiveHeader& header);

    /**
     * @brief Appends posts in the given order, then rewrites the header.
     *
     * Count and byteSize of @p header are updated here; edge ids, times and organization
     * must already describe the state after the append.
     * @throws domain::DesynchronizedError if the data file changed since the header was written.
     */
    void append(const std::vector<domain::Post>& posts, domain::ArchiveHeader& header);

    /**
     * @brief Replaces any existing pair with a fresh one holding @p firstBatch.
     * @return Backup base path when @p mode is RebuildMode::Backup and a pair existed.
     */
    std::optional<std::filesystem::path> rebuild(RebuildMode mode,
                                                 domain::ArchiveHeader& header,
                                                 const std::vector<domain::Post>& firstBatch);

    /**
     * @brief Renames the pair to `<name>.backup-<YYYYmmdd-HHMMSS>[.<n>]`.
     * @return The backup base path (without the `.meta.json` / `.data.json` suffix).
     */
    std::filesystem::path backup();

    /** @brief Deletes the pair. */
    void discard();

    /** @brief Header-only update; the data file must still match `header.storage.byteSize`. */
    void rewriteHeader(const domain::ArchiveHeader& header);

    /** @brief Cuts an uncommitted tail off the data file. */
    void truncateUncommitted(std::uint64_t committedSize);

    /** @brief Reads every stored post, in storage order. */
    std::vector<domain::Post> readPosts() const;

    /** @brief Real data file size, std::nullopt if it does not exist. */
    std::optional<std::uint64_t> dataFileSize() const;

    const std::string& archiveName() const { return m_name; }
    std::filesystem::path headerPath() const;
    std::filesystem::path dataPath() const;

private:
    void writeHeader(const domain::ArchiveHeader& header);

    std::filesystem::path m_directory;
    std::string m_name;
    PersistenceService& m_persistence;
    std::optional<ArchiveLock> m_lock;
};

} // namespace chatvault::infrastructure

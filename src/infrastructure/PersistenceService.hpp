/**
 * @file PersistenceService.hpp
 * @brief Serialized, durable file I/O used by the archive store.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace chatvault::infrastructure {

/**
 * @class PersistenceService
 * @brief Performs durable appends and atomic replacements of files.
 *
 * All operations are synchronous: when a call returns, the bytes have been flushed
 * and synced to the device. Failures throw domain::ArchiveError.
 */
class PersistenceService {
public:
    PersistenceService() = default;

    /**
     * @brief Replaces a file's content atomically (temp file, sync, rename, directory sync).
     * @param filename Target file.
     * @param content The complete new content.
     */
    void writeAtomically(const std::filesystem::path& filename, const std::string& content);

    /**
     * @brief Appends bytes to the end of a file and syncs it.
     * @return The file size after the append.
     */
    std::uint64_t appendDurably(const std::filesystem::path& filename, const std::string& content);

    /** @brief Creates (or truncates to) an empty file and syncs it. */
    void createEmpty(const std::filesystem::path& filename);

    /** @brief Shrinks a file to the given size and syncs it. */
    void truncate(const std::filesystem::path& filename, std::uint64_t size);

private:
    /** @brief fsync on a file or directory; no-op on platforms without it. */
    static void syncPath(const std::filesystem::path& path, bool isDirectory);

    std::mutex m_mutex;
};

} // namespace chatvault::infrastructure

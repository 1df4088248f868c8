/**
 * @file ArchiveLock.hpp
 * @brief Exclusive, process-level lock on one archive pair.
 */

#pragma once

#include <filesystem>

namespace chatvault::infrastructure {

/**
 * @class ArchiveLock
 * @brief Holds an advisory lock file next to the archive for its lifetime.
 *
 * Acquisition never blocks: a lock held elsewhere raises domain::ArchiveLockedError.
 * The lock file is never removed, so every holder locks the same inode.
 */
class ArchiveLock {
public:
    explicit ArchiveLock(std::filesystem::path lockPath);
    ~ArchiveLock();

    ArchiveLock(const ArchiveLock&) = delete;
    ArchiveLock& operator=(const ArchiveLock&) = delete;
    ArchiveLock(ArchiveLock&& other) noexcept;
    ArchiveLock& operator=(ArchiveLock&& other) noexcept;

    /** @brief Releases the lock early; safe to call more than once. */
    void release();

    bool held() const { return m_fd >= 0; }

private:
    std::filesystem::path m_path;
    int m_fd = -1;
};

} // namespace chatvault::infrastructure

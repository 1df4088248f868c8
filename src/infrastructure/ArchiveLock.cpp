/**
 * @file ArchiveLock.cpp
 * @brief Implementation of ArchiveLock (POSIX flock).
 */

#include "infrastructure/ArchiveLock.hpp"
#include "domain/Errors.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace chatvault::infrastructure {

ArchiveLock::ArchiveLock(std::filesystem::path lockPath) : m_path(std::move(lockPath)) {
    if (m_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
    }
    m_fd = ::open(m_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd < 0) {
        throw domain::ArchiveError("Cannot open lock file '" + m_path.string() + "': " + std::strerror(errno));
    }
    if (::flock(m_fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(m_fd);
        m_fd = -1;
        if (err == EWOULDBLOCK) {
            throw domain::ArchiveLockedError("Archive is locked by another process: " + m_path.string());
        }
        throw domain::ArchiveError("Cannot lock '" + m_path.string() + "': " + std::strerror(err));
    }
}

ArchiveLock::~ArchiveLock() {
    release();
}

ArchiveLock::ArchiveLock(ArchiveLock&& other) noexcept
    : m_path(std::move(other.m_path)), m_fd(other.m_fd) {
    other.m_fd = -1;
}

ArchiveLock& ArchiveLock::operator=(ArchiveLock&& other) noexcept {
    if (this != &other) {
        release();
        m_path = std::move(other.m_path);
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

void ArchiveLock::release() {
    if (m_fd < 0) return;
    ::flock(m_fd, LOCK_UN);
    ::close(m_fd);
    m_fd = -1;
}

} // namespace chatvault::infrastructure

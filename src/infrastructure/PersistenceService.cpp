/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"

#include <chrono>
#include <fstream>
#include <system_error>

#if !defined(_WIN32)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace chatvault::infrastructure {

namespace fs = std::filesystem;

void PersistenceService::syncPath(const fs::path& path, bool isDirectory) {
#if !defined(_WIN32)
    int flags = isDirectory ? O_RDONLY | O_DIRECTORY : O_RDONLY;
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        throw domain::ArchiveError("Cannot open '" + path.string() + "' for syncing");
    }
    int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        throw domain::ArchiveError("fsync failed for '" + path.string() + "'");
    }
#else
    (void)path;
    (void)isDirectory;
#endif
}

void PersistenceService::writeAtomically(const fs::path& filename, const std::string& content) {
    std::lock_guard<std::mutex> lock(m_mutex);

    // filename.<timestamp>.tmp, unique per operation
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = filename;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (filename.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(filename.parent_path(), ec);
        if (ec) {
            throw domain::ArchiveError("Cannot create directory '" + filename.parent_path().string() + "': " + ec.message());
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::ArchiveError("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw domain::ArchiveError("Write failed during output: " + tempPath.string());
        }
    }

    try {
        syncPath(tempPath, false);
        fs::rename(tempPath, filename);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw domain::ArchiveError("Atomic replace of '" + filename.string() + "' failed: " + e.what());
    }

    if (filename.has_parent_path()) {
        syncPath(filename.parent_path(), true);
    }
}

std::uint64_t PersistenceService::appendDurably(const fs::path& filename, const std::string& content) {
    std::lock_guard<std::mutex> lock(m_mutex);
    {
        std::ofstream ofs(filename, std::ios::binary | std::ios::app);
        if (!ofs.is_open()) {
            throw domain::ArchiveError("Failed to open for append: " + filename.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            throw domain::ArchiveError("Append failed: " + filename.string());
        }
    }
    syncPath(filename, false);

    std::error_code ec;
    auto size = fs::file_size(filename, ec);
    if (ec) {
        throw domain::ArchiveError("Cannot stat '" + filename.string() + "': " + ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

void PersistenceService::createEmpty(const fs::path& filename) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (filename.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(filename.parent_path(), ec);
        if (ec) {
            throw domain::ArchiveError("Cannot create directory '" + filename.parent_path().string() + "': " + ec.message());
        }
    }
    {
        std::ofstream ofs(filename, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::ArchiveError("Failed to create: " + filename.string());
        }
    }
    syncPath(filename, false);
}

void PersistenceService::truncate(const fs::path& filename, std::uint64_t size) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    fs::resize_file(filename, size, ec);
    if (ec) {
        throw domain::ArchiveError("Cannot truncate '" + filename.string() + "': " + ec.message());
    }
    syncPath(filename, false);
    Logger::Debug("PersistenceService", "Truncated " + filename.string() + " to " + std::to_string(size) + " bytes");
}

} // namespace chatvault::infrastructure

/**
 * @file ArchiveStore.cpp
 * @brief Implementation of ArchiveStore.
 */

#include "infrastructure/ArchiveStore.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ArchiveCodec.hpp"
#include "infrastructure/Logger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <sstream>
#include <system_error>

namespace chatvault::infrastructure {

namespace fs = std::filesystem;

namespace {

const char* const kHeaderSuffix = ".meta.json";
const char* const kDataSuffix = ".data.json";

std::string BackupStamp() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = {};
    localtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
    return buf;
}

fs::path WithSuffix(const fs::path& base, const char* suffix) {
    fs::path p = base;
    p += suffix;
    return p;
}

} // namespace

ArchiveStore::ArchiveStore(fs::path directory, std::string archiveName, PersistenceService& persistence)
    : m_directory(std::move(directory)), m_name(std::move(archiveName)), m_persistence(persistence) {}

fs::path ArchiveStore::headerPath() const {
    return m_directory / (m_name + kHeaderSuffix);
}

fs::path ArchiveStore::dataPath() const {
    return m_directory / (m_name + kDataSuffix);
}

void ArchiveStore::lock() {
    if (m_lock && m_lock->held()) return;
    m_lock.emplace(m_directory / (m_name + ".lock"));
}

void ArchiveStore::close() {
    if (m_lock) {
        m_lock->release();
        m_lock.reset();
    }
}

bool ArchiveStore::exists() const {
    std::error_code ec;
    return fs::exists(headerPath(), ec) || fs::exists(dataPath(), ec);
}

std::optional<std::uint64_t> ArchiveStore::dataFileSize() const {
    std::error_code ec;
    auto size = fs::file_size(dataPath(), ec);
    if (ec) return std::nullopt;
    return static_cast<std::uint64_t>(size);
}

std::optional<domain::ArchiveHeader> ArchiveStore::open() {
    std::error_code ec;
    if (!fs::exists(headerPath(), ec)) {
        if (fs::exists(dataPath(), ec)) {
            throw domain::CorruptHeaderError("Archive '" + m_name + "' has a data file but no header");
        }
        return std::nullopt;
    }

    std::ifstream in(headerPath(), std::ios::binary);
    if (!in.is_open()) {
        throw domain::CorruptHeaderError("Cannot read header of archive '" + m_name + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    domain::ArchiveHeader header = ArchiveCodec::ParseHeader(buffer.str());

    auto actual = dataFileSize();
    std::uint64_t expected = header.storage.byteSize;
    if (!actual) {
        if (expected != 0) {
            throw domain::DesynchronizedError(m_name, expected, std::nullopt);
        }
    } else if (*actual != expected) {
        throw domain::DesynchronizedError(m_name, expected, actual);
    }
    return header;
}

void ArchiveStore::create(domain::ArchiveHeader& header) {
    header.storage.count = 0;
    header.storage.byteSize = 0;

    domain::ArchiveHeader empty = header;
    empty.storage.beginTime.reset();
    empty.storage.endTime.reset();
    empty.storage.firstPostId.reset();
    empty.storage.lastPostId.reset();
    empty.storage.postIdBeforeFirst.reset();
    empty.storage.postIdAfterLast.reset();

    m_persistence.createEmpty(dataPath());
    writeHeader(empty);
    Logger::Debug("ArchiveStore", "Created archive " + m_name);
}

void ArchiveStore::append(const std::vector<domain::Post>& posts, domain::ArchiveHeader& header) {
    auto actual = dataFileSize();
    if (actual.value_or(0) != header.storage.byteSize) {
        throw domain::DesynchronizedError(m_name, header.storage.byteSize, actual);
    }

    std::string content;
    for (const auto& post : posts) {
        content += ArchiveCodec::EncodePostLine(post);
    }
    std::uint64_t newSize = header.storage.byteSize;
    if (!content.empty()) {
        newSize = m_persistence.appendDurably(dataPath(), content);
    }
    if (newSize != header.storage.byteSize + content.size()) {
        throw domain::DesynchronizedError(m_name, header.storage.byteSize + content.size(), newSize);
    }

    header.storage.byteSize = newSize;
    header.storage.count += static_cast<std::int64_t>(posts.size());
    writeHeader(header);
}

std::optional<fs::path> ArchiveStore::rebuild(RebuildMode mode,
                                              domain::ArchiveHeader& header,
                                              const std::vector<domain::Post>& firstBatch) {
    std::optional<fs::path> backupPath;
    if (exists()) {
        switch (mode) {
            case RebuildMode::Backup:
                backupPath = backup();
                break;
            case RebuildMode::Discard:
                discard();
                break;
            case RebuildMode::None:
                Logger::Warning("ArchiveStore", "Replacing existing files of archive " + m_name);
                break;
        }
    }

    create(header);
    if (!firstBatch.empty()) {
        append(firstBatch, header);
    }
    return backupPath;
}

fs::path ArchiveStore::backup() {
    const std::string stem = m_name + ".backup-" + BackupStamp();
    fs::path base = m_directory / stem;
    std::error_code ec;
    for (int n = 1; fs::exists(WithSuffix(base, kHeaderSuffix), ec) || fs::exists(WithSuffix(base, kDataSuffix), ec); ++n) {
        base = m_directory / (stem + "." + std::to_string(n));
    }

    try {
        if (fs::exists(headerPath())) {
            fs::rename(headerPath(), WithSuffix(base, kHeaderSuffix));
        }
        if (fs::exists(dataPath())) {
            fs::rename(dataPath(), WithSuffix(base, kDataSuffix));
        }
    } catch (const fs::filesystem_error& e) {
        throw domain::ArchiveError("Backup of archive '" + m_name + "' failed: " + e.what());
    }
    Logger::Info("ArchiveStore", "Archive " + m_name + " backed up as " + base.filename().string());
    return base;
}

void ArchiveStore::discard() {
    // Header before data.
    std::error_code ec;
    fs::remove(headerPath(), ec);
    if (ec) {
        throw domain::ArchiveError("Cannot delete header of archive '" + m_name + "': " + ec.message());
    }
    fs::remove(dataPath(), ec);
    if (ec) {
        throw domain::ArchiveError("Cannot delete data of archive '" + m_name + "': " + ec.message());
    }
    Logger::Info("ArchiveStore", "Archive " + m_name + " deleted");
}

void ArchiveStore::rewriteHeader(const domain::ArchiveHeader& header) {
    auto actual = dataFileSize();
    if (actual.value_or(0) != header.storage.byteSize) {
        throw domain::DesynchronizedError(m_name, header.storage.byteSize, actual);
    }
    writeHeader(header);
}

void ArchiveStore::truncateUncommitted(std::uint64_t committedSize) {
    auto actual = dataFileSize();
    if (!actual || *actual < committedSize) {
        throw domain::DesynchronizedError(m_name, committedSize, actual);
    }
    if (*actual == committedSize) return;
    Logger::Warning("ArchiveStore", "Dropping " + std::to_string(*actual - committedSize) +
                                        " uncommitted bytes from archive " + m_name);
    m_persistence.truncate(dataPath(), committedSize);
}

std::vector<domain::Post> ArchiveStore::readPosts() const {
    std::vector<domain::Post> posts;
    std::ifstream in(dataPath(), std::ios::binary);
    if (!in.is_open()) {
        return posts;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        posts.push_back(ArchiveCodec::DecodePostLine(line));
    }
    return posts;
}

void ArchiveStore::writeHeader(const domain::ArchiveHeader& header) {
    m_persistence.writeAtomically(headerPath(), ArchiveCodec::SerializeHeader(header));
}

} // namespace chatvault::infrastructure

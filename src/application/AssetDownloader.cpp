/**
 * @file AssetDownloader.cpp
 * @brief Implementation of AssetDownloader.
 */

#include "application/AssetDownloader.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <system_error>

namespace chatvault::application {

namespace fs = std::filesystem;
using infrastructure::Logger;
using infrastructure::PathUtils;

namespace {

/** @brief Name of a file in @p directory called @p stem, with or without extension. */
std::string FindExisting(const fs::path& directory, const std::string& stem) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) return "";
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        const std::string name = entry.path().filename().string();
        if (name == stem || entry.path().stem().string() == stem) {
            return name;
        }
    }
    return "";
}

} // namespace

AssetDownloader::AssetDownloader(domain::RemoteDirectory& remote,
                                 infrastructure::PersistenceService& persistence,
                                 fs::path outputDirectory,
                                 const CancellationToken& cancel)
    : m_remote(remote),
      m_persistence(persistence),
      m_outputDirectory(std::move(outputDirectory)),
      m_cancel(cancel) {}

template <typename Fetch>
std::string AssetDownloader::store(const fs::path& directory,
                                   const std::string& stem,
                                   const std::string& nameHint,
                                   Fetch fetch) {
    if (!PathUtils::IsPlainFileName(stem)) {
        Logger::Warning("AssetDownloader", "Refusing to store asset under name '" + stem + "'");
        return "";
    }
    std::string existing = FindExisting(directory, stem);
    if (!existing.empty()) {
        return existing;
    }

    try {
        domain::RemoteAsset asset = fetch();
        const std::string fileName = stem + PathUtils::ExtensionFor(nameHint, asset.contentType);

        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            throw domain::ArchiveError("Cannot create directory " + directory.string() + ": " + ec.message());
        }
        m_persistence.writeAtomically(directory / fileName, asset.content);
        ++m_filesWritten;
        Logger::Debug("AssetDownloader", "Stored " + (directory / fileName).string());
        return fileName;
    } catch (const domain::TransportFailure& e) {
        Logger::Warning("AssetDownloader", "Download of '" + stem + "' failed: " + e.what());
    } catch (const domain::RemoteRequestError& e) {
        Logger::Warning("AssetDownloader", "Download of '" + stem + "' failed: " + e.what());
    } catch (const domain::ArchiveError& e) {
        Logger::Warning("AssetDownloader", "Cannot store '" + stem + "': " + e.what());
    }
    return "";
}

void AssetDownloader::downloadAttachments(const std::string& archiveName,
                                          const std::vector<domain::Post>& posts,
                                          const domain::AttachmentOptions& options) {
    const fs::path directory = m_outputDirectory / (archiveName + "--files");
    for (const auto& post : posts) {
        for (const auto& attachment : post.attachments) {
            if (m_cancel.stopRequested()) return;
            if (options.maxSize > 0 && attachment.byteSize > options.maxSize) {
                continue;
            }
            if (!options.allowedMimeTypes.empty()) {
                const std::string mime = attachment.mimeType.value_or("");
                if (std::find(options.allowedMimeTypes.begin(), options.allowedMimeTypes.end(), mime) ==
                    options.allowedMimeTypes.end()) {
                    continue;
                }
            }
            store(directory, attachment.id, attachment.name,
                  [&]() { return m_remote.downloadAttachment(attachment); });
        }
    }
}

bool AssetDownloader::downloadEmojiImages(std::vector<domain::Emoji>& emojis) {
    const fs::path directory = m_outputDirectory / "emojis";
    bool changed = false;
    for (auto& emoji : emojis) {
        if (m_cancel.stopRequested()) break;
        std::string fileName = store(directory, emoji.name, "",
                                     [&]() { return m_remote.downloadEmojiImage(emoji); });
        if (!fileName.empty() && emoji.imageFileName != fileName) {
            emoji.imageFileName = fileName;
            changed = true;
        }
    }
    return changed;
}

bool AssetDownloader::downloadAvatars(std::vector<domain::User>& users) {
    const fs::path directory = m_outputDirectory / "avatars";
    bool changed = false;
    for (auto& user : users) {
        if (m_cancel.stopRequested()) break;
        std::string fileName = store(directory, user.name, "",
                                     [&]() { return m_remote.downloadAvatar(user); });
        if (!fileName.empty() && user.avatarFileName != fileName) {
            user.avatarFileName = fileName;
            changed = true;
        }
    }
    return changed;
}

bool AssetDownloader::downloadForArchive(const std::string& archiveName,
                                         const std::vector<domain::Post>& posts,
                                         domain::ArchiveHeader& header,
                                         const domain::ChannelOptions& options) {
    bool changed = false;
    if (options.attachments.download) {
        downloadAttachments(archiveName, posts, options.attachments);
    }
    if (options.downloadEmoji) {
        changed = downloadEmojiImages(header.emojis) || changed;
    }
    if (options.downloadAvatars) {
        changed = downloadAvatars(header.users) || changed;
    }
    return changed;
}

void AssetDownloader::downloadEmojiDatabase() {
    std::vector<domain::Emoji> emojis = m_remote.listEmojis();
    Logger::Info("AssetDownloader", "Downloading " + std::to_string(emojis.size()) + " custom emojis");
    downloadEmojiImages(emojis);
}

} // namespace chatvault::application

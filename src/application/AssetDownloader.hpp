/**
 * @file AssetDownloader.hpp
 * @brief Stores attachments, emoji images and avatars next to the archives.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "application/CancellationToken.hpp"
#include "domain/ArchiveHeader.hpp"
#include "domain/ChannelOptions.hpp"
#include "domain/RemoteDirectory.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace chatvault::application {

/**
 * @class AssetDownloader
 * @brief Downloads binary assets referenced by an archive.
 *
 * Files already present are never downloaded again. A failed asset is logged and
 * skipped; only domain::AuthFailure propagates.
 */
class AssetDownloader {
public:
    AssetDownloader(domain::RemoteDirectory& remote,
                    infrastructure::PersistenceService& persistence,
                    std::filesystem::path outputDirectory,
                    const CancellationToken& cancel);

    /**
     * @brief Downloads the assets of one channel run.
     * @param archiveName Archive the attachments belong to.
     * @param posts Posts written during the run.
     * @param header Header of the archive; file names of emojis and avatars are recorded on it.
     * @return True if @p header was changed and must be rewritten.
     */
    bool downloadForArchive(const std::string& archiveName,
                            const std::vector<domain::Post>& posts,
                            domain::ArchiveHeader& header,
                            const domain::ChannelOptions& options);

    /** @brief Stores the image of every custom emoji of the server. */
    void downloadEmojiDatabase();

    std::size_t filesWritten() const { return m_filesWritten; }

private:
    void downloadAttachments(const std::string& archiveName,
                             const std::vector<domain::Post>& posts,
                             const domain::AttachmentOptions& options);
    bool downloadEmojiImages(std::vector<domain::Emoji>& emojis);
    bool downloadAvatars(std::vector<domain::User>& users);

    /**
     * @brief Fetches one asset into @p directory unless a file with @p stem exists already.
     * @return Stored file name, empty on failure.
     */
    template <typename Fetch>
    std::string store(const std::filesystem::path& directory,
                      const std::string& stem,
                      const std::string& nameHint,
                      Fetch fetch);

    domain::RemoteDirectory& m_remote;
    infrastructure::PersistenceService& m_persistence;
    std::filesystem::path m_outputDirectory;
    const CancellationToken& m_cancel;
    std::size_t m_filesWritten = 0;
};

} // namespace chatvault::application

// PathUtils Header
#pragma once
#include <string>
#include <vector>
#include <filesystem>

namespace chatvault::infrastructure {

class PathUtils {
public:
    /** @brief Configuration files tried when none is given, in order. */
    static std::vector<std::filesystem::path> GetConfigCandidates();

    /** @brief True for a non-empty name without directory separators or dot-only names. */
    static bool IsPlainFileName(const std::string& name);

    /**
     * @brief File extension (with the dot) taken from @p fileName, else derived from @p contentType.
     * @return Empty string when neither yields one.
     */
    static std::string ExtensionFor(const std::string& fileName, const std::string& contentType);
};

} // namespace chatvault::infrastructure

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace chatvault::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kConfigFileName = "chatvault.json";
}

std::vector<fs::path> PathUtils::GetConfigCandidates() {
    std::vector<fs::path> candidates;
    candidates.push_back(fs::path(".") / kConfigFileName);

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        candidates.push_back(fs::path(xdgConfigHome) / kConfigFileName);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        candidates.push_back(fs::path(home) / ".config" / kConfigFileName);
    }
    return candidates;
}

bool PathUtils::IsPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

std::string PathUtils::ExtensionFor(const std::string& fileName, const std::string& contentType) {
    std::string ext = fs::path(fileName).extension().string();
    if (!ext.empty() && ext.size() > 1) {
        return ext;
    }

    // "image/png; charset=..." -> "png"
    std::string mime = contentType.substr(0, contentType.find(';'));
    auto slash = mime.find('/');
    if (slash == std::string::npos || slash + 1 >= mime.size()) {
        return "";
    }
    std::string subtype = mime.substr(slash + 1);
    while (!subtype.empty() && subtype.back() == ' ') subtype.pop_back();
    if (subtype == "jpeg") return ".jpg";
    if (subtype == "svg+xml") return ".svg";
    if (subtype == "plain") return ".txt";
    if (subtype == "octet-stream" || subtype.empty()) return "";
    return "." + subtype;
}

} // namespace chatvault::infrastructure

#include "infrastructure/PathUtils.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace gitdu::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetCacheHome() {
    const char* xdgCacheHome = std::getenv("XDG_CACHE_HOME");
    if (xdgCacheHome && *xdgCacheHome) {
        return fs::path(xdgCacheHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".cache";
    }
    return fs::current_path();
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / "gitdu" / "settings.json";
}

fs::path PathUtils::GetCacheDir() {
    return GetCacheHome() / "gitdu";
}

fs::path PathUtils::CacheFileFor(const fs::path& cacheDir, const std::string& repoRoot,
                                 const std::string& glob) {
    std::string repoName = fs::path(repoRoot).filename().string();
    if (repoName.empty()) repoName = "repo";

    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx",
                  static_cast<unsigned long long>(Fnv1a64(repoRoot + "\n" + glob)));
    return cacheDir / (repoName + "-" + hex + ".jsonl");
}

std::uint64_t PathUtils::Fnv1a64(const std::string& data) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // namespace gitdu::infrastructure

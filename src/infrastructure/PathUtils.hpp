// PathUtils Header
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace gitdu::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    /** @brief Default settings.json location: $XDG_CONFIG_HOME/gitdu/settings.json. */
    static std::filesystem::path GetSettingsFile();

    /** @brief Default cache directory: $XDG_CACHE_HOME/gitdu. */
    static std::filesystem::path GetCacheDir();

    /**
     * @brief Cache log path for one scope (repository root + glob pattern).
     * Format: <cacheDir>/<repo-name>-<fnv1a64 hex>.jsonl
     */
    static std::filesystem::path CacheFileFor(const std::filesystem::path& cacheDir,
                                              const std::string& repoRoot,
                                              const std::string& glob);

    /** @brief 64-bit FNV-1a, stable across platforms and runs. */
    static std::uint64_t Fnv1a64(const std::string& data);
};

} // namespace gitdu::infrastructure

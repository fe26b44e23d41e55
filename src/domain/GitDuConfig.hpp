/**
 * @file GitDuConfig.hpp
 * @brief Tunables read from settings.json and overridden by the command line.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "domain/SortKey.hpp"

namespace gitdu::domain {

/**
 * @enum LazyMode
 * @brief Whether subtree aggregation is deferred until expansion.
 */
enum class LazyMode {
    Auto, ///< Lazy when the tracked file count exceeds lazyFileThreshold.
    On,
    Off
};

inline std::string LazyModeToString(LazyMode mode) {
    switch (mode) {
        case LazyMode::Auto: return "auto";
        case LazyMode::On: return "on";
        case LazyMode::Off: return "off";
        default: return "unknown";
    }
}

inline std::optional<LazyMode> LazyModeFromString(const std::string& value) {
    if (value == "auto") return LazyMode::Auto;
    if (value == "on" || value == "true") return LazyMode::On;
    if (value == "off" || value == "false") return LazyMode::Off;
    return std::nullopt;
}

struct GitDuConfig {
    LazyMode lazyMode = LazyMode::Auto;
    std::size_t lazyFileThreshold = 20000;
    std::size_t batchSize = 64;      ///< Commits per durable append + checkpoint.
    std::size_t queueCapacity = 256; ///< Bound of each pipeline queue.
    SortKey defaultSort = SortKey::LatestChange;
    std::string cacheDir;            ///< Empty means $XDG_CACHE_HOME/gitdu.
    int printDepth = 2;
};

} // namespace gitdu::domain

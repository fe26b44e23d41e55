/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading gitdu configuration (settings.json).
 *
 * Provides a unified way to access tunables like the lazy-mode threshold
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <string>

#include "domain/GitDuConfig.hpp"

namespace gitdu::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param configPath Path to the settings file.
     * @return Defaults overlaid with every recognized key. A missing file yields the
     *         defaults; a malformed file or value is reported on stderr and ignored.
     */
    static domain::GitDuConfig Load(const std::filesystem::path& configPath);

    /**
     * @brief Parses settings from a JSON document held in memory.
     */
    static domain::GitDuConfig Parse(const std::string& jsonText);
};

} // namespace gitdu::infrastructure

/**
 * @file CommandLine.hpp
 * @brief Command line options of the gitdu executable.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/SortKey.hpp"

namespace gitdu::app {

/** @brief Invalid command line. Exit code 2. */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandLineOptions {
    std::string repoPath = ".";
    bool refresh = false;
    bool resume = false;
    std::optional<bool> lazy;
    std::optional<std::string> glob;
    std::optional<domain::SortKey> sortKey;
    std::optional<int> depth;
    std::optional<std::string> configFile;
    std::optional<std::string> cacheDir;
    bool showVersion = false;
    bool showHelp = false;
};

/**
 * @brief Parses arguments (without the program name).
 * @throws UsageError on unknown flags, missing values or conflicting flags.
 */
CommandLineOptions ParseCommandLine(const std::vector<std::string>& args);

std::string UsageText();

} // namespace gitdu::app

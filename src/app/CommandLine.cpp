/**
 * @file CommandLine.cpp
 * @brief Implementation of the command line parser.
 */

#include "app/CommandLine.hpp"

namespace gitdu::app {

namespace {

int ParseDepth(const std::string& value) {
    std::size_t used = 0;
    int depth = 0;
    try {
        depth = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw UsageError("--depth expects a number, got '" + value + "'");
    }
    if (used != value.size() || depth < 0) {
        throw UsageError("--depth expects a non-negative number, got '" + value + "'");
    }
    return depth;
}

} // namespace

std::string UsageText() {
    return
        "Usage: gitdu [repo] [options]\n"
        "\n"
        "Browse per-path commit activity of a git repository.\n"
        "\n"
        "Options:\n"
        "  --refresh          discard the cache and rescan the whole history\n"
        "  --resume           continue an interrupted scan from its checkpoint\n"
        "  --lazy, --no-lazy  force lazy (per-subtree) loading on or off\n"
        "  --glob PATTERN     only count files matching PATTERN (default **/*)\n"
        "  --sort KEY         commit_count | latest_change | total_changes | author_count\n"
        "  --depth N          levels to print below the root\n"
        "  --config FILE      settings file (default $XDG_CONFIG_HOME/gitdu/settings.json)\n"
        "  --cache-dir DIR    cache directory (default $XDG_CACHE_HOME/gitdu)\n"
        "  --version          print the version and exit\n"
        "  --help             print this help and exit\n";
}

CommandLineOptions ParseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    bool repoSeen = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Accept both "--flag value" and "--flag=value".
        std::string flag = arg;
        std::optional<std::string> inlineValue;
        if (arg.rfind("--", 0) == 0) {
            const std::size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                flag = arg.substr(0, eq);
                inlineValue = arg.substr(eq + 1);
            }
        }
        auto value = [&]() -> std::string {
            if (inlineValue) return *inlineValue;
            if (i + 1 >= args.size()) throw UsageError(flag + " requires a value");
            return args[++i];
        };

        if (flag == "--refresh") {
            options.refresh = true;
        } else if (flag == "--resume") {
            options.resume = true;
        } else if (flag == "--lazy") {
            options.lazy = true;
        } else if (flag == "--no-lazy") {
            options.lazy = false;
        } else if (flag == "--glob") {
            options.glob = value();
        } else if (flag == "--sort") {
            const std::string key = value();
            options.sortKey = domain::SortKeyFromString(key);
            if (!options.sortKey) throw UsageError("unknown sort key '" + key + "'");
        } else if (flag == "--depth") {
            options.depth = ParseDepth(value());
        } else if (flag == "--config") {
            options.configFile = value();
        } else if (flag == "--cache-dir") {
            options.cacheDir = value();
        } else if (flag == "--version") {
            options.showVersion = true;
        } else if (flag == "--help" || flag == "-h") {
            options.showHelp = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option '" + arg + "'");
        } else {
            if (repoSeen) throw UsageError("unexpected argument '" + arg + "'");
            options.repoPath = arg;
            repoSeen = true;
        }
    }

    if (options.refresh && options.resume) {
        throw UsageError("--refresh and --resume cannot be combined");
    }
    return options;
}

} // namespace gitdu::app

/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>

namespace gitdu::infrastructure {

namespace {

void WarnType(const char* key, const nlohmann::json& value, const char* expected) {
    std::cerr << "[ConfigLoader] Ignoring " << key << ": expected " << expected << ", got " << value << std::endl;
}

// Each key is checked on its own so one bad value does not discard the rest.
std::optional<std::string> ReadString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    const auto& value = j.at(key);
    if (!value.is_string()) {
        WarnType(key, value, "a string");
        return std::nullopt;
    }
    return value.get<std::string>();
}

std::optional<std::size_t> ReadCount(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    const auto& value = j.at(key);
    if (!value.is_number_unsigned()) {
        WarnType(key, value, "a non-negative integer");
        return std::nullopt;
    }
    return value.get<std::size_t>();
}

void ApplyJson(const nlohmann::json& j, domain::GitDuConfig& config) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json root is not an object, using defaults" << std::endl;
        return;
    }

    if (auto text = ReadString(j, "lazy_mode")) {
        auto mode = domain::LazyModeFromString(*text);
        if (mode) {
            config.lazyMode = *mode;
        } else {
            std::cerr << "[ConfigLoader] Unknown lazy_mode: " << *text << std::endl;
        }
    }
    if (auto n = ReadCount(j, "lazy_file_threshold")) {
        config.lazyFileThreshold = *n;
    }
    if (auto n = ReadCount(j, "batch_size")) {
        config.batchSize = std::max<std::size_t>(1, *n);
    }
    if (auto n = ReadCount(j, "queue_capacity")) {
        config.queueCapacity = std::max<std::size_t>(1, *n);
    }
    if (auto text = ReadString(j, "default_sort")) {
        auto key = domain::SortKeyFromString(*text);
        if (key) {
            config.defaultSort = *key;
        } else {
            std::cerr << "[ConfigLoader] Unknown default_sort: " << *text << std::endl;
        }
    }
    if (auto text = ReadString(j, "cache_dir")) {
        config.cacheDir = *text;
    }
    if (auto n = ReadCount(j, "print_depth")) {
        if (*n <= 1000) {
            config.printDepth = static_cast<int>(*n);
        } else {
            WarnType("print_depth", j.at("print_depth"), "a depth up to 1000");
        }
    }
}

} // namespace

domain::GitDuConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    if (!std::filesystem::exists(configPath)) {
        return {};
    }

    std::ifstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << ", using defaults" << std::endl;
        return {};
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str());
}

domain::GitDuConfig ConfigLoader::Parse(const std::string& jsonText) {
    domain::GitDuConfig config;
    try {
        ApplyJson(nlohmann::json::parse(jsonText), config);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return domain::GitDuConfig{};
    }
    return config;
}

} // namespace gitdu::infrastructure

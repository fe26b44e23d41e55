#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "test/FakeGitDataSource.hpp"

using namespace gitdu::domain;
using gitdu::infrastructure::ConfigLoader;
using gitdu::infrastructure::PathUtils;

int main() {
    std::cout << "[Test] Defaults..." << std::endl;
    GitDuConfig defaults;
    assert(defaults.lazyMode == LazyMode::Auto);
    assert(defaults.batchSize > 0 && defaults.queueCapacity > 0);

    std::cout << "[Test] Every recognized key is applied..." << std::endl;
    GitDuConfig parsed = ConfigLoader::Parse(R"({
        "lazy_mode": "on",
        "lazy_file_threshold": 500,
        "batch_size": 16,
        "queue_capacity": 8,
        "default_sort": "commits",
        "cache_dir": "/tmp/gitdu-cache",
        "print_depth": 4,
        "unknown_key": true
    })");
    assert(parsed.lazyMode == LazyMode::On);
    assert(parsed.lazyFileThreshold == 500);
    assert(parsed.batchSize == 16);
    assert(parsed.queueCapacity == 8);
    assert(parsed.defaultSort == SortKey::CommitCount);
    assert(parsed.cacheDir == "/tmp/gitdu-cache");
    assert(parsed.printDepth == 4);

    std::cout << "[Test] Bad values fall back to defaults..." << std::endl;
    GitDuConfig zero = ConfigLoader::Parse(R"({"batch_size": 0, "lazy_mode": "sometimes"})");
    assert(zero.batchSize == 1);
    assert(zero.lazyMode == LazyMode::Auto);
    assert(ConfigLoader::Parse("{ not json").batchSize == defaults.batchSize);
    assert(ConfigLoader::Parse(R"({"batch_size": "many"})").batchSize == defaults.batchSize);
    assert(ConfigLoader::Parse("[1, 2]").lazyMode == LazyMode::Auto);

    std::cout << "[Test] A wrong-typed key keeps the other keys..." << std::endl;
    GitDuConfig mixed = ConfigLoader::Parse(R"({
        "batch_size": "64",
        "queue_capacity": -3,
        "lazy_mode": 1,
        "print_depth": 5,
        "default_sort": "authors",
        "cache_dir": ["/nope"],
        "lazy_file_threshold": 77
    })");
    assert(mixed.batchSize == defaults.batchSize);
    assert(mixed.queueCapacity == defaults.queueCapacity);
    assert(mixed.lazyMode == defaults.lazyMode);
    assert(mixed.cacheDir == defaults.cacheDir);
    assert(mixed.printDepth == 5);
    assert(mixed.defaultSort == SortKey::AuthorCount);
    assert(mixed.lazyFileThreshold == 77);

    std::cout << "[Test] Loading from disk..." << std::endl;
    const std::filesystem::path dir = gitdu::test::ScratchDir("config");
    assert(ConfigLoader::Load(dir / "missing.json").printDepth == defaults.printDepth);
    {
        std::ofstream out(dir / "settings.json");
        out << R"({"lazy_mode": "off", "default_sort": "authors"})";
    }
    GitDuConfig loaded = ConfigLoader::Load(dir / "settings.json");
    assert(loaded.lazyMode == LazyMode::Off);
    assert(loaded.defaultSort == SortKey::AuthorCount);

    std::cout << "[Test] Cache file names depend on repository and glob..." << std::endl;
    auto a = PathUtils::CacheFileFor(dir, "/work/repo", "**/*");
    auto b = PathUtils::CacheFileFor(dir, "/work/repo", "*.cpp");
    auto c = PathUtils::CacheFileFor(dir, "/work/other", "**/*");
    assert(a != b && a != c);
    assert(a == PathUtils::CacheFileFor(dir, "/work/repo", "**/*"));
    assert(a.parent_path() == dir);

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] ConfigLoader tests passed." << std::endl;
    return 0;
}

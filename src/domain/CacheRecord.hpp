/**
 * @file CacheRecord.hpp
 * @brief Records persisted in the cache log.
 */

#pragma once

#include <string>
#include <variant>

#include "domain/ChangeEvent.hpp"
#include "domain/ScanCursor.hpp"

namespace gitdu::domain {

/**
 * @struct CacheHeader
 * @brief First line of every cache log. Identifies the scope and the scan order.
 */
struct CacheHeader {
    static constexpr const char* Kind = "header";
    static constexpr int CurrentVersion = 1;
    static constexpr const char* TopoReverseOrder = "topo-reverse";

    int version = CurrentVersion;
    std::string repo;
    std::string glob;
    std::string order = TopoReverseOrder;
};

/** @brief A commit that could not be read, recorded so resume does not retry it forever. */
struct CommitSkip {
    static constexpr const char* Kind = "skip";
    std::string commitId;
    std::string reason;
};

/** @brief A subtree fully scanned up to @c head (lazy mode). */
struct ScopeMark {
    static constexpr const char* Kind = "scope";
    std::string prefix;
    std::string head;
};

/** @brief A cursor checkpoint as stored in the log. */
struct Checkpoint {
    static constexpr const char* Kind = "checkpoint";
    ScanCursor cursor;
    std::int64_t writtenAt = 0; ///< Wall clock seconds, informational only.
};

using CacheRecord = std::variant<CacheHeader, ChangeEvent, CommitSkip, ScopeMark, Checkpoint>;

} // namespace gitdu::domain

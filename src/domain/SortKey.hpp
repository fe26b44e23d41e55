/**
 * @file SortKey.hpp
 * @brief Value Object selecting which metric orders a directory listing.
 */

#pragma once

#include <optional>
#include <string>

namespace gitdu::domain {

/**
 * @enum SortKey
 * @brief Metric used to order siblings in the tree.
 */
enum class SortKey {
    CommitCount,  ///< Distinct commits touching the path.
    LatestChange, ///< Most recent change timestamp.
    TotalChanges, ///< Insertions plus deletions.
    AuthorCount   ///< Distinct authors.
};

/**
 * @brief Stable identifier used on the command line and in settings.json.
 */
inline std::string SortKeyToString(SortKey key) {
    switch (key) {
        case SortKey::CommitCount: return "commit_count";
        case SortKey::LatestChange: return "latest_change";
        case SortKey::TotalChanges: return "total_changes";
        case SortKey::AuthorCount: return "author_count";
        default: return "unknown";
    }
}

/**
 * @brief Human readable label for headers.
 */
inline std::string SortKeyLabel(SortKey key) {
    switch (key) {
        case SortKey::CommitCount: return "Commits";
        case SortKey::LatestChange: return "Latest Change";
        case SortKey::TotalChanges: return "Total Changes";
        case SortKey::AuthorCount: return "Authors";
        default: return "Unknown";
    }
}

/**
 * @brief Parses an identifier; accepts the short aliases "commits", "latest", "changes" and "authors".
 */
inline std::optional<SortKey> SortKeyFromString(const std::string& value) {
    if (value == "commit_count" || value == "commits") return SortKey::CommitCount;
    if (value == "latest_change" || value == "latest") return SortKey::LatestChange;
    if (value == "total_changes" || value == "changes") return SortKey::TotalChanges;
    if (value == "author_count" || value == "authors") return SortKey::AuthorCount;
    return std::nullopt;
}

/**
 * @brief Cycles to the next key, in the order a sort toggle walks through them.
 */
inline SortKey NextSortKey(SortKey key) {
    switch (key) {
        case SortKey::CommitCount: return SortKey::LatestChange;
        case SortKey::LatestChange: return SortKey::TotalChanges;
        case SortKey::TotalChanges: return SortKey::AuthorCount;
        case SortKey::AuthorCount: return SortKey::CommitCount;
        default: return SortKey::CommitCount;
    }
}

} // namespace gitdu::domain

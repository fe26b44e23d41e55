/**
 * @file ChangeEvent.hpp
 * @brief Commit history value types: per-file change events and raw commit records.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gitdu::domain {

/**
 * @struct ChangeEvent
 * @brief One file's change within one commit. Unique by (path, commitId).
 */
struct ChangeEvent {
    static constexpr const char* Kind = "event";

    std::string path;          ///< Repository-relative path with '/' separators.
    std::string commitId;      ///< 40-hex commit id.
    std::string author;        ///< Author e-mail.
    std::int64_t timestamp = 0; ///< Author time, seconds since the epoch.
    std::int64_t insertions = 0;
    std::int64_t deletions = 0;

    std::int64_t changes() const { return insertions + deletions; }

    bool operator==(const ChangeEvent& other) const {
        return path == other.path && commitId == other.commitId && author == other.author &&
               timestamp == other.timestamp && insertions == other.insertions &&
               deletions == other.deletions;
    }
};

/**
 * @struct FileDiffStat
 * @brief Insertion/deletion counts for one file relative to the commit's parent.
 */
struct FileDiffStat {
    std::string path;
    std::int64_t insertions = 0;
    std::int64_t deletions = 0;
    bool binary = false;
};

/**
 * @struct CommitRecord
 * @brief A commit as reported by the Git Data Source.
 */
struct CommitRecord {
    std::string commitId;
    std::vector<std::string> parentIds;
    std::string author;
    std::int64_t timestamp = 0;
    std::string subject;
    std::vector<FileDiffStat> files;
};

} // namespace gitdu::domain

/**
 * @file PathStats.hpp
 * @brief Activity metrics for a file or directory.
 */

#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <unordered_set>

#include "domain/ChangeEvent.hpp"

namespace gitdu::domain {

/**
 * @class PathStats
 * @brief Fold of every ChangeEvent under a path.
 *
 * Commits are counted through the set of distinct commit ids, so a commit touching
 * several files of a directory counts once for that directory.
 */
class PathStats {
public:
    /**
     * @brief Folds one event in.
     * @return False if the event's commit was already counted for this path
     *         (changes and authors are still merged).
     */
    bool fold(const ChangeEvent& event);

    bool hasCommit(const std::string& commitId) const { return m_commits.count(commitId) > 0; }

    std::size_t commitCount() const { return m_commits.size(); }
    std::int64_t insertions() const { return m_insertions; }
    std::int64_t deletions() const { return m_deletions; }
    std::int64_t totalChanges() const { return m_insertions + m_deletions; }
    std::int64_t latestTimestamp() const { return m_latestTimestamp; }
    std::int64_t firstTimestamp() const { return m_firstTimestamp; }
    const std::string& latestCommitId() const { return m_latestCommitId; }
    const std::string& latestAuthor() const { return m_latestAuthor; }
    const std::set<std::string>& authors() const { return m_authors; }
    std::size_t authorCount() const { return m_authors.size(); }
    bool empty() const { return m_commits.empty(); }

    bool operator==(const PathStats& other) const;
    bool operator!=(const PathStats& other) const { return !(*this == other); }

private:
    std::unordered_set<std::string> m_commits;
    std::set<std::string> m_authors;
    std::int64_t m_insertions = 0;
    std::int64_t m_deletions = 0;
    std::int64_t m_latestTimestamp = 0;
    std::int64_t m_firstTimestamp = 0;
    std::string m_latestCommitId;
    std::string m_latestAuthor;
};

} // namespace gitdu::domain

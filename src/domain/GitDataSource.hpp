/**
 * @file GitDataSource.hpp
 * @brief Interface to the repository's commit history.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/ChangeEvent.hpp"

namespace gitdu::domain {

/**
 * @class GitDataSource
 * @brief Abstract access to commits, heads and tracked files of one repository.
 *
 * Implementations throw RepositoryAccessError when the repository cannot be queried,
 * and CommitReadError from readCommit() when a single commit cannot be parsed.
 */
class GitDataSource {
public:
    virtual ~GitDataSource() = default;

    /** @brief Absolute path of the repository work tree. */
    virtual std::string repositoryRoot() const = 0;

    /** @brief Current head commit id, or nullopt for a repository without commits. */
    virtual std::optional<std::string> headCommitId() = 0;

    /** @brief True if the object exists and is a commit. */
    virtual bool hasCommit(const std::string& commitId) = 0;

    /** @brief True if @p ancestor is reachable from @p descendant (a commit is its own ancestor). */
    virtual bool isAncestor(const std::string& ancestor, const std::string& descendant) = 0;

    /**
     * @brief Lists commits reachable from @p tip but not from any of @p excludes,
     *        oldest ancestor first (topological order).
     * @param pathspec When non-empty, only commits touching that path prefix.
     */
    virtual std::vector<std::string> listCommits(const std::string& tip,
                                                 const std::vector<std::string>& excludes,
                                                 const std::string& pathspec) = 0;

    /**
     * @brief Reads one commit with its per-file diff stats relative to its parent
     *        (merge commits report no files).
     * @param pathspec When non-empty, only files under that path prefix are reported.
     * @throws CommitReadError when the commit or its diff cannot be parsed.
     */
    virtual CommitRecord readCommit(const std::string& commitId, const std::string& pathspec) = 0;

    /** @brief Paths tracked at head (used for the lazy-mode skeleton and size estimate). */
    virtual std::vector<std::string> listTrackedFiles() = 0;
};

} // namespace gitdu::domain

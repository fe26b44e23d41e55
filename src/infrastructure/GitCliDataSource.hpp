/**
 * @file GitCliDataSource.hpp
 * @brief GitDataSource backed by the git command line.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/GitDataSource.hpp"

namespace gitdu::infrastructure {

/**
 * @class GitCliDataSource
 * @brief Runs `git -C <root> ...` through popen and parses its output.
 */
class GitCliDataSource : public domain::GitDataSource {
public:
    /**
     * @brief Resolves the work tree containing @p location.
     * @throws RepositoryAccessError if @p location is not inside a git work tree
     *         or git cannot be run.
     */
    explicit GitCliDataSource(const std::string& location);

    std::string repositoryRoot() const override { return m_root; }
    std::optional<std::string> headCommitId() override;
    bool hasCommit(const std::string& commitId) override;
    bool isAncestor(const std::string& ancestor, const std::string& descendant) override;
    std::vector<std::string> listCommits(const std::string& tip,
                                         const std::vector<std::string>& excludes,
                                         const std::string& pathspec) override;
    domain::CommitRecord readCommit(const std::string& commitId, const std::string& pathspec) override;
    std::vector<std::string> listTrackedFiles() override;

    /** @brief Single-quotes @p value for /bin/sh. */
    static std::string ShellQuote(const std::string& value);

private:
    struct CommandResult {
        int exitCode = -1;
        std::string output;
    };

    /** @brief Runs git with @p args in the work tree; stderr is discarded. */
    CommandResult run(const std::string& args) const;

    static CommandResult RunShell(const std::string& command);
    static std::string PathspecArg(const std::string& pathspec);

    std::string m_root;
};

/** @brief Pretty format passed to `git show`; fields are separated by 0x1f. */
extern const char* const ShowFormat;

/**
 * @brief Parses `git show --numstat --format=<ShowFormat>` output.
 * Binary files ("-" counts) are reported with zero counts; merge commits report no files.
 * @throws CommitReadError if the output is truncated or malformed.
 */
domain::CommitRecord ParseShowOutput(const std::string& commitId, const std::string& output);

/** @brief Decodes a C-style quoted path ("a\tb", "\303\251") as printed by git. */
std::string UnquoteGitPath(const std::string& path);

} // namespace gitdu::infrastructure

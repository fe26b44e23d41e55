/**
 * @file Errors.hpp
 * @brief Exception hierarchy shared by every gitdu layer.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace gitdu::domain {

/**
 * @class GitDuError
 * @brief Base class for all errors raised by gitdu components.
 */
class GitDuError : public std::runtime_error {
public:
    explicit GitDuError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief No repository at the given location, or git itself failed. Fatal. */
class RepositoryAccessError : public GitDuError {
public:
    explicit RepositoryAccessError(const std::string& message) : GitDuError(message) {}
};

/**
 * @brief A cache record could not be decoded.
 * Recoverable: the store truncates the log to the last valid record.
 */
class CacheCorruptionError : public GitDuError {
public:
    CacheCorruptionError(const std::string& message, std::size_t lineNumber)
        : GitDuError(message), m_lineNumber(lineNumber) {}

    std::size_t lineNumber() const { return m_lineNumber; }

private:
    std::size_t m_lineNumber;
};

/** @brief Another session holds the cache write lock. Fatal. */
class ConcurrentWriterError : public GitDuError {
public:
    explicit ConcurrentWriterError(const std::string& message) : GitDuError(message) {}
};

/** @brief A single commit could not be read. Recoverable: the commit is skipped. */
class CommitReadError : public GitDuError {
public:
    CommitReadError(const std::string& commitId, const std::string& message)
        : GitDuError(message), m_commitId(commitId) {}

    const std::string& commitId() const { return m_commitId; }

private:
    std::string m_commitId;
};

/** @brief The --glob pattern is invalid. Fatal at startup. */
class GlobPatternError : public GitDuError {
public:
    explicit GlobPatternError(const std::string& message) : GitDuError(message) {}
};

/** @brief I/O failure on the cache files. */
class CacheIoError : public GitDuError {
public:
    explicit CacheIoError(const std::string& message) : GitDuError(message) {}
};

} // namespace gitdu::domain

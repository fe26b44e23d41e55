/**
 * @file CacheStore.hpp
 * @brief Durable, append-only JSON lines log of change events and scan checkpoints.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "domain/CacheRecord.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace gitdu::infrastructure {

/**
 * @class CacheStore
 * @brief Incremental cache for one scope (repository + glob).
 *
 * Layout next to the log file @c X.jsonl:
 * - @c X.jsonl        one record per line, never rewritten except by reset()
 * - @c X.jsonl.lock   flock()ed by the single writer session
 * - @c X.jsonl.cursor.json  latest checkpoint, mirrored asynchronously
 *
 * Only newline-terminated, decodable lines are valid. A torn or malformed line ends the
 * valid prefix of the log; open() truncates the file back to that prefix.
 *
 * All methods are thread-safe.
 */
class CacheStore {
public:
    enum class Status {
        Empty,      ///< Nothing scanned yet.
        Incomplete, ///< A scan segment was interrupted; resume continues it.
        Stale,      ///< Complete, but the repository head moved since.
        Fresh       ///< Complete at the live head.
    };

    struct LoadReport {
        std::size_t validRecords = 0;
        std::size_t discardedLines = 0;
        bool truncatedTail = false; ///< Last line was incomplete.
        bool corruptionRepaired = false; ///< A malformed line in the middle ended the log.
        bool scopeMismatch = false; ///< Header did not match; the cache was reset.
    };

    CacheStore(std::filesystem::path logPath, domain::CacheHeader scope,
               std::shared_ptr<PersistenceService> persistence);
    ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    /**
     * @brief Takes the writer lock and loads the log.
     * @throws ConcurrentWriterError if another session holds the lock.
     * @throws CacheIoError on I/O failure.
     */
    void open();

    /** @brief Waits for the cursor sidecar, closes the log and releases the lock. */
    void close();

    bool isOpen() const;

    /**
     * @brief Writes records durably (single write + fdatasync).
     * Events already stored, by (path, commit), are dropped.
     * @return Number of records actually written.
     */
    std::size_t append(const std::vector<domain::CacheRecord>& records);

    /**
     * @brief Records progress. Call only after the covered events were appended.
     * @throws std::invalid_argument if the cursor would move backwards.
     */
    void checkpoint(const domain::ScanCursor& cursor);

    /** @brief Records that every commit touching @p prefix up to @p head is stored. */
    void recordScope(const std::string& prefix, const std::string& head);

    /** @brief Discards every record of the scope (full refresh). */
    void reset();

    std::optional<domain::ScanCursor> cursor() const;
    std::vector<domain::ChangeEvent> events() const;
    std::vector<domain::ChangeEvent> eventsUnder(const std::string& prefix) const;
    std::vector<domain::CommitSkip> skippedCommits() const;
    std::size_t eventCount() const;
    bool containsEvent(const std::string& path, const std::string& commitId) const;

    /**
     * @brief Heads whose ancestry is fully recorded for @p prefix: the completed full-scan
     *        base plus scope marks on @p prefix or any of its ancestors.
     */
    std::vector<std::string> coverageHeads(const std::string& prefix) const;

    Status status(const std::optional<std::string>& liveHead) const;
    LoadReport lastLoadReport() const;

    const std::filesystem::path& logPath() const { return m_logPath; }
    const domain::CacheHeader& scope() const { return m_scope; }

    static std::filesystem::path LockPathFor(const std::filesystem::path& logPath);
    static std::filesystem::path CursorPathFor(const std::filesystem::path& logPath);

    /** @brief Reads the cursor sidecar without opening (or locking) the log. */
    static std::optional<domain::ScanCursor> ReadCursorFile(const std::filesystem::path& logPath);

private:
    void acquireLock();
    void loadLocked();
    void resetLocked();
    void openLogFdLocked();
    void writeLocked(const std::string& bytes);
    void applyLocked(const domain::CacheRecord& record);
    void clearMemoryLocked();

    static std::string EventKey(const std::string& path, const std::string& commitId);

    mutable std::mutex m_mutex;
    std::filesystem::path m_logPath;
    domain::CacheHeader m_scope;
    std::shared_ptr<PersistenceService> m_persistence;

    int m_lockFd = -1;
    int m_logFd = -1;
    std::uint64_t m_logSize = 0;

    std::vector<domain::ChangeEvent> m_events;
    std::unordered_set<std::string> m_eventKeys;
    std::optional<domain::ScanCursor> m_cursor;
    std::vector<domain::CommitSkip> m_skips;
    std::map<std::string, std::string> m_scopes; ///< prefix -> latest head
    LoadReport m_report;
};

std::string CacheStatusToString(CacheStore::Status status);

} // namespace gitdu::infrastructure

/**
 * @file PersistenceService.hpp
 * @brief Background writer for small files that are replaced as a whole.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace gitdu::infrastructure {

/** @brief One queued replacement of a file's content. */
struct PendingWrite {
    std::string path;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Single worker thread replacing files in submission order.
 *
 * Carries the cursor sidecar off the scan path. The last write submitted for a path is
 * the one left on disk. A failed write is logged and dropped; the cache log stays the
 * authority.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Queues a replacement of @p path with @p content and returns immediately.
     */
    void replaceAsync(const std::string& path, const std::string& content);

    /**
     * @brief Blocks until every queued write has been performed.
     */
    void flush();

    /** @brief Drains the queue, then joins the worker. Idempotent. */
    void stop();

    std::size_t pending() const;

    /**
     * @brief Synchronous atomic replace: write temp, fsync, rename, fsync directory.
     * @throws CacheIoError on failure; the target is left untouched.
     */
    static void writeAtomic(const std::string& path, const std::string& content);

private:
    void workerLoop();

    std::queue<PendingWrite> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace gitdu::infrastructure

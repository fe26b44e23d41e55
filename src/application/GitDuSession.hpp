/**
 * @file GitDuSession.hpp
 * @brief One browsing session: cache, aggregate tree, background scan and expansions.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "application/AsyncTaskManager.hpp"
#include "application/CancellationToken.hpp"
#include "application/LazyLoadController.hpp"
#include "application/NavigationModel.hpp"
#include "application/StatsAggregator.hpp"
#include "domain/GitDataSource.hpp"
#include "domain/GitDuConfig.hpp"
#include "domain/PathFilter.hpp"
#include "infrastructure/CacheStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace gitdu::application {

/**
 * @struct SessionOptions
 * @brief Normal, lazy and resume runs are all one configuration of the same pipeline.
 */
struct SessionOptions {
    std::string glob = domain::PathFilter::MatchAll;
    bool refresh = false;              ///< Discard the cache before scanning.
    bool resume = false;               ///< Report the checkpoint being continued.
    std::optional<bool> lazyOverride;  ///< --lazy / --no-lazy
    domain::GitDuConfig config;
    std::filesystem::path cacheFile;   ///< Empty: derived from config.cacheDir, repository and glob.
};

/**
 * @class GitDuSession
 * @brief Composition root of the scan-cache-aggregate pipeline.
 *
 * open() performs every fatal check (glob, lock, repository) up front. The aggregate tree
 * is guarded by a shared mutex: readers take snapshots, the scan and expansions write.
 */
class GitDuSession : public NavigationModel {
public:
    GitDuSession(std::shared_ptr<domain::GitDataSource> source, SessionOptions options,
                 std::shared_ptr<infrastructure::PersistenceService> persistence = nullptr);
    ~GitDuSession() override;

    GitDuSession(const GitDuSession&) = delete;
    GitDuSession& operator=(const GitDuSession&) = delete;

    /**
     * @brief Validates the glob, locks and loads the cache and builds the initial tree.
     * @throws GlobPatternError, ConcurrentWriterError, RepositoryAccessError, CacheIoError
     */
    void open();

    /**
     * @brief Starts the delta (or full) scan in the background.
     * @return nullptr in lazy mode or when the cache is already fresh.
     */
    std::shared_ptr<TaskStatus> startBackgroundScan();

    /** @brief Blocks until the scan and every expansion have finished. */
    void waitForIdle();

    /** @brief Stops background work at the next commit boundary. */
    void cancel();

    bool lazy() const { return m_lazy; }
    bool cancelled() const { return m_cancel.isCancelled(); }
    const std::filesystem::path& cacheFile() const { return m_options.cacheFile; }
    infrastructure::CacheStore::Status cacheStatus() const;

    // NavigationModel
    std::optional<NodeSnapshot> getNode(const std::string& path) const override;
    std::vector<NodeSnapshot> children(const std::string& path) const override;
    void setSortKey(domain::SortKey key) override;
    domain::SortKey sortKey() const override;
    std::shared_ptr<TaskStatus> requestExpand(const std::string& path) override;
    void collapse(const std::string& path) override;
    int onUpdate(UpdateCallback callback) override;
    ScanStatus status() const override;

private:
    bool decideLazy(const std::vector<std::string>& trackedFiles) const;
    void buildSkeleton(const std::vector<std::string>& trackedFiles);
    void runScan(const std::shared_ptr<TaskStatus>& status);
    void notify(const std::string& path);
    NodeSnapshot snapshot(const domain::PathNode& node) const;

    std::shared_ptr<domain::GitDataSource> m_source;
    SessionOptions m_options;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;

    std::optional<domain::PathFilter> m_filter;
    std::unique_ptr<infrastructure::CacheStore> m_store;
    std::unique_ptr<LazyLoadController> m_lazyLoader;
    std::optional<std::string> m_liveHead;
    bool m_lazy = false;

    mutable std::shared_mutex m_treeMutex;
    StatsAggregator m_aggregator;
    domain::SortKey m_sortKey;

    std::mutex m_callbackMutex;
    std::map<int, UpdateCallback> m_callbacks;
    int m_nextCallbackId = 0;

    mutable std::mutex m_statusMutex;
    std::shared_ptr<TaskStatus> m_scanTask;
    std::optional<std::string> m_lastError;

    CancellationToken m_cancel;
    AsyncTaskManager m_tasks; ///< Declared last: joined before the members its tasks use.
};

} // namespace gitdu::application

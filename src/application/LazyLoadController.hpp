/**
 * @file LazyLoadController.hpp
 * @brief Deferred, per-subtree aggregation driven by expansion requests.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/CancellationToken.hpp"
#include "application/StatsAggregator.hpp"
#include "domain/GitDataSource.hpp"
#include "domain/PathFilter.hpp"
#include "domain/PathNode.hpp"
#include "infrastructure/CacheStore.hpp"

namespace gitdu::application {

/**
 * @struct SubtreeAggregate
 * @brief Result of one expansion: a private tree holding the subtree and the events it folds.
 */
struct SubtreeAggregate {
    std::string prefix;
    std::unique_ptr<StatsAggregator> aggregate;
    std::vector<domain::ChangeEvent> events;
    std::size_t commitsScanned = 0; ///< Commits read from git because the cache did not cover them.
};

/**
 * @class LazyLoadController
 * @brief Tracks the load state of expanded subtrees and computes them in the background.
 *
 * Each expansion uses its own aggregator; only the cache store is shared. A subtree that
 * is loaded stays loaded: collapsing only changes what the view shows.
 */
class LazyLoadController {
public:
    using LoadedFn = std::function<void(SubtreeAggregate& result)>;
    using FailedFn = std::function<void(const std::string& prefix, const std::string& error)>;

    LazyLoadController(std::shared_ptr<domain::GitDataSource> source, infrastructure::CacheStore& store,
                       domain::PathFilter filter, AsyncTaskManager& tasks, const CancellationToken* cancel = nullptr);

    /**
     * @brief Starts loading @p path unless it (or an ancestor) is loaded or loading.
     *
     * @p onLoaded runs on the task thread before the state becomes Loaded; @p onFailed
     * runs after the state went back to Unloaded.
     * @return The task status; already completed when nothing had to be done.
     */
    std::shared_ptr<TaskStatus> expand(const std::string& path, LoadedFn onLoaded, FailedFn onFailed);

    void collapse(const std::string& path);

    domain::LoadState state(const std::string& path) const;
    bool isExpanded(const std::string& path) const;
    std::size_t loadingCount() const;

    /**
     * @brief Folds the cached events under @p prefix, scanning the commits the cache does not
     *        cover yet (and recording them, plus a scope marker, in the store).
     */
    static SubtreeAggregate ComputeSubtree(domain::GitDataSource& source, infrastructure::CacheStore& store,
                                           const domain::PathFilter& filter, const std::string& prefix,
                                           const CancellationToken* cancel = nullptr);

private:
    static std::shared_ptr<TaskStatus> CompletedStatus(const std::string& path);

    std::shared_ptr<domain::GitDataSource> m_source;
    infrastructure::CacheStore& m_store;
    domain::PathFilter m_filter;
    AsyncTaskManager& m_tasks;
    const CancellationToken* m_cancel;

    mutable std::mutex m_mutex;
    std::set<std::string> m_loaded;
    std::map<std::string, std::shared_ptr<TaskStatus>> m_loading;
    std::set<std::string> m_expanded;
};

} // namespace gitdu::application

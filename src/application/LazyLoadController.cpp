/**
 * @file LazyLoadController.cpp
 * @brief Implementation of LazyLoadController.
 */

#include "application/LazyLoadController.hpp"

#include <iostream>
#include <stdexcept>

#include "application/HistoryScanner.hpp"

namespace gitdu::application {

using namespace gitdu::domain;

namespace {

constexpr std::size_t kScopedBatch = 64;

} // namespace

LazyLoadController::LazyLoadController(std::shared_ptr<GitDataSource> source, infrastructure::CacheStore& store,
                                       PathFilter filter, AsyncTaskManager& tasks, const CancellationToken* cancel)
    : m_source(std::move(source)), m_store(store), m_filter(std::move(filter)), m_tasks(tasks), m_cancel(cancel) {}

std::shared_ptr<TaskStatus> LazyLoadController::CompletedStatus(const std::string& path) {
    auto status = std::make_shared<TaskStatus>();
    status->id = -1;
    status->type = TaskType::SubtreeExpansion;
    status->description = "Expand " + path;
    status->progress = 1.0f;
    status->isCompleted = true;
    return status;
}

LoadState LazyLoadController::state(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& prefix : m_loaded) {
        if (IsUnderPrefix(path, prefix)) return LoadState::Loaded;
    }
    if (m_loading.count(path) > 0) return LoadState::Loading;
    return LoadState::Unloaded;
}

bool LazyLoadController::isExpanded(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_expanded.count(path) > 0;
}

std::size_t LazyLoadController::loadingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loading.size();
}

void LazyLoadController::collapse(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_expanded.erase(path);
}

std::shared_ptr<TaskStatus> LazyLoadController::expand(const std::string& path, LoadedFn onLoaded, FailedFn onFailed) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_expanded.insert(path);
    for (const auto& prefix : m_loaded) {
        if (IsUnderPrefix(path, prefix)) return CompletedStatus(path);
    }
    auto running = m_loading.find(path);
    if (running != m_loading.end()) return running->second;

    // The task takes m_mutex only when it finishes, so submitting under the lock is safe.
    auto status = m_tasks.SubmitTask(TaskType::SubtreeExpansion, "Expand " + (path.empty() ? "/" : path),
        [this, path, onLoaded, onFailed](std::shared_ptr<TaskStatus> task) {
            try {
                SubtreeAggregate result = ComputeSubtree(*m_source, m_store, m_filter, path, m_cancel);
                task->processed = result.commitsScanned;
                if (onLoaded) onLoaded(result);
                std::lock_guard<std::mutex> done(m_mutex);
                m_loading.erase(path);
                m_loaded.insert(path);
            } catch (const std::exception& e) {
                std::cerr << "[LazyLoad] Expanding '" << path << "' failed: " << e.what() << std::endl;
                {
                    std::lock_guard<std::mutex> done(m_mutex);
                    m_loading.erase(path);
                }
                if (onFailed) onFailed(path, e.what());
                throw;
            }
        });
    m_loading[path] = status;
    return status;
}

SubtreeAggregate LazyLoadController::ComputeSubtree(GitDataSource& source, infrastructure::CacheStore& store,
                                                    const PathFilter& filter, const std::string& prefix,
                                                    const CancellationToken* cancel) {
    SubtreeAggregate result;
    result.prefix = prefix;

    ScanPlan plan = HistoryScanner::PlanScoped(source, prefix, store.coverageHeads(prefix));
    if (plan.pendingCommits() > 0) {
        HistoryScanner scanner(source, filter, cancel);
        scanner.start(plan);

        std::vector<CacheRecord> batch;
        std::size_t commitsInBatch = 0;
        while (auto item = scanner.next()) {
            if (item->commitId.empty()) continue;
            ++result.commitsScanned;
            if (item->skipped) batch.push_back(CommitSkip{item->commitId, item->skipReason});
            for (auto& e : item->events) batch.push_back(std::move(e));
            if (++commitsInBatch >= kScopedBatch) {
                store.append(batch);
                batch.clear();
                commitsInBatch = 0;
            }
        }
        store.append(batch);

        if (!scanner.finished()) {
            throw std::runtime_error("expansion of '" + prefix + "' was cancelled");
        }
    }
    if (plan.liveHead && !plan.segments.empty()) {
        store.recordScope(prefix, *plan.liveHead);
    }

    result.events = store.eventsUnder(prefix);
    result.aggregate = std::make_unique<StatsAggregator>();
    result.aggregate->applyAll(result.events);
    return result;
}

} // namespace gitdu::application

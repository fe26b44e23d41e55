/**
 * @file GitDuSession.cpp
 * @brief Implementation of GitDuSession.
 */

#include "application/GitDuSession.hpp"

#include <iostream>
#include <stdexcept>

#include "application/HistoryScanner.hpp"
#include "application/ScanPipeline.hpp"
#include "infrastructure/PathUtils.hpp"

namespace gitdu::application {

using namespace gitdu::domain;
using infrastructure::CacheStore;

GitDuSession::GitDuSession(std::shared_ptr<GitDataSource> source, SessionOptions options,
                           std::shared_ptr<infrastructure::PersistenceService> persistence)
    : m_source(std::move(source)), m_options(std::move(options)), m_persistence(std::move(persistence)),
      m_sortKey(m_options.config.defaultSort) {
    if (!m_persistence) {
        m_persistence = std::make_shared<infrastructure::PersistenceService>();
    }
}

GitDuSession::~GitDuSession() {
    m_cancel.cancel();
    m_tasks.WaitAll();
    if (m_store) {
        try {
            m_store->close();
        } catch (const std::exception& e) {
            std::cerr << "[GitDuSession] Error closing cache: " << e.what() << std::endl;
        }
    }
}

void GitDuSession::open() {
    m_filter.emplace(m_options.glob);

    const std::string root = m_source->repositoryRoot();
    if (m_options.cacheFile.empty()) {
        const std::filesystem::path dir = m_options.config.cacheDir.empty()
            ? infrastructure::PathUtils::GetCacheDir()
            : std::filesystem::path(m_options.config.cacheDir);
        m_options.cacheFile = infrastructure::PathUtils::CacheFileFor(dir, root, m_options.glob);
    }

    CacheHeader scope;
    scope.repo = root;
    scope.glob = m_options.glob;
    m_store = std::make_unique<CacheStore>(m_options.cacheFile, scope, m_persistence);
    m_store->open();

    if (m_options.refresh) {
        m_store->reset();
    } else if (m_options.resume) {
        if (auto cursor = CacheStore::ReadCursorFile(m_options.cacheFile)) {
            std::cerr << "[GitDuSession] Resuming after " << cursor->processedCount << " commits ("
                      << (cursor->lastProcessedCommitId.empty() ? "none" : cursor->lastProcessedCommitId.substr(0, 12))
                      << ")" << std::endl;
        } else {
            std::cerr << "[GitDuSession] No checkpoint to resume from; starting a fresh scan" << std::endl;
        }
    }

    m_liveHead = m_source->headCommitId();

    std::vector<std::string> tracked;
    if (m_options.lazyOverride) {
        m_lazy = *m_options.lazyOverride;
    } else if (m_options.config.lazyMode == LazyMode::Auto) {
        tracked = m_source->listTrackedFiles();
        m_lazy = decideLazy(tracked);
    } else {
        m_lazy = m_options.config.lazyMode == LazyMode::On;
    }

    if (m_lazy) {
        if (tracked.empty()) tracked = m_source->listTrackedFiles();
        m_lazyLoader = std::make_unique<LazyLoadController>(m_source, *m_store, *m_filter, m_tasks, &m_cancel);
        buildSkeleton(tracked);
    } else {
        std::unique_lock<std::shared_mutex> lock(m_treeMutex);
        m_aggregator.rebuild(m_store->events());
    }

    std::cerr << "[GitDuSession] Cache " << m_options.cacheFile.string() << " is "
              << infrastructure::CacheStatusToString(m_store->status(m_liveHead)) << " ("
              << m_store->eventCount() << " events" << (m_lazy ? ", lazy mode" : "") << ")" << std::endl;
}

bool GitDuSession::decideLazy(const std::vector<std::string>& trackedFiles) const {
    std::size_t matching = 0;
    for (const auto& path : trackedFiles) {
        if (m_filter->matches(path) && ++matching > m_options.config.lazyFileThreshold) {
            return true;
        }
    }
    return false;
}

void GitDuSession::buildSkeleton(const std::vector<std::string>& trackedFiles) {
    std::unique_lock<std::shared_mutex> lock(m_treeMutex);
    m_aggregator.rebuild({});
    for (const auto& path : trackedFiles) {
        if (m_filter->matches(path)) m_aggregator.ensurePath(path);
    }
    for (const auto& [name, child] : m_aggregator.root().children()) {
        child->setSubtreeLoadState(LoadState::Unloaded);
    }
}

std::shared_ptr<TaskStatus> GitDuSession::startBackgroundScan() {
    if (m_lazy || !m_store) return nullptr;

    std::lock_guard<std::mutex> lock(m_statusMutex);
    if (m_scanTask && !m_scanTask->isCompleted) return m_scanTask;
    if (m_store->status(m_liveHead) == CacheStore::Status::Fresh) return nullptr;

    m_scanTask = m_tasks.SubmitTask(TaskType::HistoryScan, "History scan",
        [this](std::shared_ptr<TaskStatus> status) { runScan(status); });
    return m_scanTask;
}

void GitDuSession::runScan(const std::shared_ptr<TaskStatus>& status) {
    try {
        ScanPlan plan = HistoryScanner::PlanResume(*m_source, m_store->cursor());
        if (plan.requiresFullRefresh) {
            std::cerr << "[GitDuSession] Full refresh: " << plan.refreshReason << std::endl;
            m_store->reset();
            {
                std::unique_lock<std::shared_mutex> lock(m_treeMutex);
                m_aggregator.rebuild({});
            }
            notify("");
            plan = HistoryScanner::PlanResume(*m_source, std::nullopt);
        }
        if (plan.liveHead) {
            std::lock_guard<std::mutex> lock(m_statusMutex);
            m_liveHead = plan.liveHead;
        }

        if (plan.upToDate()) {
            status->processed = plan.alreadyProcessed;
            status->total = plan.alreadyProcessed;
            return;
        }

        HistoryScanner scanner(*m_source, *m_filter, &m_cancel);
        scanner.start(std::move(plan));

        PipelineOptions options;
        options.batchSize = m_options.config.batchSize;
        options.queueCapacity = m_options.config.queueCapacity;

        ScanPipeline pipeline(scanner, *m_store, [this](const std::vector<ChangeEvent>& events) {
            {
                std::unique_lock<std::shared_mutex> lock(m_treeMutex);
                m_aggregator.applyAll(events);
            }
            notify("");
        }, options, status);

        const PipelineResult result = pipeline.run();
        std::cerr << "[GitDuSession] Scan " << (result.cancelled ? "interrupted" : "complete") << ": "
                  << result.commitsProcessed << " commits, " << result.eventsWritten << " events";
        if (result.commitsSkipped > 0) std::cerr << ", " << result.commitsSkipped << " skipped";
        std::cerr << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[GitDuSession] Background scan failed: " << e.what() << std::endl;
        {
            std::lock_guard<std::mutex> lock(m_statusMutex);
            m_lastError = e.what();
        }
        notify("");
        throw;
    }
}

void GitDuSession::waitForIdle() {
    m_tasks.WaitAll();
}

void GitDuSession::cancel() {
    m_cancel.cancel();
}

CacheStore::Status GitDuSession::cacheStatus() const {
    std::optional<std::string> head;
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        head = m_liveHead;
    }
    return m_store ? m_store->status(head) : CacheStore::Status::Empty;
}

NodeSnapshot GitDuSession::snapshot(const PathNode& node) const {
    NodeSnapshot s;
    s.name = node.name();
    s.path = node.path();
    s.isDirectory = node.isDirectory();
    s.loadState = node.loadState();
    s.expanded = m_lazyLoader ? m_lazyLoader->isExpanded(node.path()) : true;
    const PathStats& st = node.stats();
    s.commitCount = st.commitCount();
    s.insertions = st.insertions();
    s.deletions = st.deletions();
    s.totalChanges = st.totalChanges();
    s.latestTimestamp = st.latestTimestamp();
    s.firstTimestamp = st.firstTimestamp();
    s.latestCommitId = st.latestCommitId();
    s.latestAuthor = st.latestAuthor();
    s.authorCount = st.authorCount();
    s.childCount = node.children().size();
    return s;
}

std::optional<NodeSnapshot> GitDuSession::getNode(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(m_treeMutex);
    const PathNode* node = m_aggregator.find(path);
    if (!node) return std::nullopt;
    return snapshot(*node);
}

std::vector<NodeSnapshot> GitDuSession::children(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(m_treeMutex);
    std::vector<NodeSnapshot> result;
    const PathNode* node = m_aggregator.find(path);
    if (!node) return result;
    for (const PathNode* child : StatsAggregator::SortedChildren(*node, m_sortKey)) {
        result.push_back(snapshot(*child));
    }
    return result;
}

void GitDuSession::setSortKey(SortKey key) {
    {
        std::unique_lock<std::shared_mutex> lock(m_treeMutex);
        if (m_sortKey == key) return;
        m_sortKey = key;
    }
    notify("");
}

SortKey GitDuSession::sortKey() const {
    std::shared_lock<std::shared_mutex> lock(m_treeMutex);
    return m_sortKey;
}

std::shared_ptr<TaskStatus> GitDuSession::requestExpand(const std::string& path) {
    {
        std::unique_lock<std::shared_mutex> lock(m_treeMutex);
        PathNode* node = m_aggregator.find(path);
        if (!node) {
            throw std::invalid_argument("no such path: " + path);
        }
        if (!m_lazyLoader) {
            auto done = std::make_shared<TaskStatus>();
            done->id = -1;
            done->type = TaskType::SubtreeExpansion;
            done->description = "Expand " + path;
            done->progress = 1.0f;
            done->isCompleted = true;
            return done;
        }
        if (node->loadState() == LoadState::Unloaded) {
            node->setLoadState(LoadState::Loading);
        }
    }
    notify(path);

    // Callbacks run on the expansion task and take the tree lock themselves.
    return m_lazyLoader->expand(path,
        [this](SubtreeAggregate& result) {
            {
                std::unique_lock<std::shared_mutex> lock(m_treeMutex);
                m_aggregator.graft(result.prefix, *result.aggregate, result.events);
                if (PathNode* node = m_aggregator.find(result.prefix)) {
                    node->setSubtreeLoadState(LoadState::Loaded);
                }
            }
            notify(result.prefix);
        },
        [this](const std::string& prefix, const std::string& error) {
            {
                std::unique_lock<std::shared_mutex> lock(m_treeMutex);
                if (PathNode* node = m_aggregator.find(prefix)) {
                    node->setLoadState(LoadState::Unloaded);
                }
            }
            {
                std::lock_guard<std::mutex> lock(m_statusMutex);
                m_lastError = "expanding '" + prefix + "': " + error;
            }
            notify(prefix);
        });
}

void GitDuSession::collapse(const std::string& path) {
    if (m_lazyLoader) m_lazyLoader->collapse(path);
    notify(path);
}

int GitDuSession::onUpdate(UpdateCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    const int id = m_nextCallbackId++;
    m_callbacks.emplace(id, std::move(callback));
    return id;
}

void GitDuSession::notify(const std::string& path) {
    std::vector<UpdateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        for (const auto& [id, cb] : m_callbacks) callbacks.push_back(cb);
    }
    for (const auto& cb : callbacks) {
        try {
            cb(path);
        } catch (const std::exception& e) {
            std::cerr << "[GitDuSession] Update callback failed: " << e.what() << std::endl;
        }
    }
}

ScanStatus GitDuSession::status() const {
    ScanStatus s;
    s.lazy = m_lazy;
    if (m_lazyLoader) s.expansionsRunning = m_lazyLoader->loadingCount();
    if (m_store) {
        const CacheStore::Status cache = cacheStatus();
        s.cacheState = infrastructure::CacheStatusToString(cache);
        // Lazy sessions load subtrees on demand and never scan the whole history.
        s.stale = !m_lazy && cache != CacheStore::Status::Fresh;
    }

    std::lock_guard<std::mutex> lock(m_statusMutex);
    if (m_scanTask) {
        s.scanning = !m_scanTask->isCompleted;
        s.processed = m_scanTask->processed;
        s.total = m_scanTask->total;
        s.progress = m_scanTask->progress;
        if (m_scanTask->failed) s.error = m_scanTask->errorMessage();
    }
    if (!s.error && m_lastError) s.error = m_lastError;
    return s;
}

} // namespace gitdu::application

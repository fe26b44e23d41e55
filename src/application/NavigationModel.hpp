/**
 * @file NavigationModel.hpp
 * @brief Read-mostly view of the activity tree consumed by front ends.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "domain/PathNode.hpp"
#include "domain/SortKey.hpp"

namespace gitdu::application {

/**
 * @struct NodeSnapshot
 * @brief Copy of one node's aggregate, safe to keep while the tree changes.
 */
struct NodeSnapshot {
    std::string name;
    std::string path;
    bool isDirectory = false;
    domain::LoadState loadState = domain::LoadState::Loaded;
    bool expanded = false;
    std::size_t commitCount = 0;
    std::int64_t insertions = 0;
    std::int64_t deletions = 0;
    std::int64_t totalChanges = 0;
    std::int64_t latestTimestamp = 0;
    std::int64_t firstTimestamp = 0;
    std::string latestCommitId;
    std::string latestAuthor;
    std::size_t authorCount = 0;
    std::size_t childCount = 0;
};

/**
 * @struct ScanStatus
 * @brief Progress and health of the background work, for a status line.
 */
struct ScanStatus {
    bool scanning = false;
    bool lazy = false;
    bool stale = false; ///< Shown aggregates lag the live head.
    std::string cacheState;
    std::uint64_t processed = 0;
    std::uint64_t total = 0;
    float progress = 0.0f;
    std::size_t expansionsRunning = 0;
    std::optional<std::string> error;
};

/**
 * @class NavigationModel
 * @brief What a tree renderer needs: snapshots, sorted listings, expansion and notifications.
 */
class NavigationModel {
public:
    /** @brief Called from worker threads with the path whose subtree changed ("" for the root). */
    using UpdateCallback = std::function<void(const std::string& path)>;

    virtual ~NavigationModel() = default;

    virtual std::optional<NodeSnapshot> getNode(const std::string& path) const = 0;

    /** @brief Children of @p path ordered by the current sort key. */
    virtual std::vector<NodeSnapshot> children(const std::string& path) const = 0;

    virtual void setSortKey(domain::SortKey key) = 0;
    virtual domain::SortKey sortKey() const = 0;

    /** @brief Asks for @p path to be aggregated; returns the task doing it. */
    virtual std::shared_ptr<TaskStatus> requestExpand(const std::string& path) = 0;
    virtual void collapse(const std::string& path) = 0;

    /** @return Subscription id. */
    virtual int onUpdate(UpdateCallback callback) = 0;

    virtual ScanStatus status() const = 0;
};

} // namespace gitdu::application

/**
 * @file StatsAggregator.hpp
 * @brief Folds change events into the per-path activity tree.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "domain/ChangeEvent.hpp"
#include "domain/PathNode.hpp"
#include "domain/SortKey.hpp"

namespace gitdu::application {

/**
 * @class StatsAggregator
 * @brief Owns one PathNode tree and keeps it equal to the fold of the events applied.
 *
 * Not thread-safe; the session serializes access.
 */
class StatsAggregator {
public:
    StatsAggregator();

    /**
     * @brief Folds @p event into its file node and every ancestor.
     * @return False if the (path, commit) pair was already applied.
     */
    bool apply(const domain::ChangeEvent& event);

    /** @brief Applies events in order; returns how many were new. */
    std::size_t applyAll(const std::vector<domain::ChangeEvent>& events);

    /** @brief Discards the tree and folds @p events into a fresh one. */
    void rebuild(const std::vector<domain::ChangeEvent>& events);

    domain::PathNode& root() { return *m_root; }
    const domain::PathNode& root() const { return *m_root; }

    const domain::PathNode* find(const std::string& path) const { return m_root->find(path); }
    domain::PathNode* find(const std::string& path) { return m_root->find(path); }

    /** @brief Creates the node for a tracked file (and its directories) without stats. */
    domain::PathNode& ensurePath(const std::string& path);

    /**
     * @brief Replaces the subtree at @p prefix with the one in @p computed (a tree rooted
     *        like this one, built from @p events) and folds the events not applied yet
     *        into the ancestors of @p prefix.
     */
    void graft(const std::string& prefix, const StatsAggregator& computed,
               const std::vector<domain::ChangeEvent>& events);

    std::size_t appliedEvents() const { return m_applied.size(); }

    /**
     * @brief Children ordered by @p key, largest first; equal keys by name ascending.
     */
    static std::vector<const domain::PathNode*> SortedChildren(const domain::PathNode& node, domain::SortKey key);

private:
    static std::string EventKey(const std::string& path, const std::string& commitId);

    std::unique_ptr<domain::PathNode> m_root;
    std::unordered_set<std::string> m_applied;
};

} // namespace gitdu::application

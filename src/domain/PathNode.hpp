/**
 * @file PathNode.hpp
 * @brief Node of the in-memory activity tree.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "domain/PathStats.hpp"

namespace gitdu::domain {

/**
 * @enum LoadState
 * @brief Whether a node's subtree has been aggregated (lazy mode lifecycle).
 */
enum class LoadState {
    Unloaded,
    Loading,
    Loaded
};

inline std::string LoadStateToString(LoadState state) {
    switch (state) {
        case LoadState::Unloaded: return "unloaded";
        case LoadState::Loading: return "loading";
        case LoadState::Loaded: return "loaded";
        default: return "unknown";
    }
}

/**
 * @class PathNode
 * @brief A file or directory with its aggregate. Owns its children exclusively.
 *
 * The root has an empty name and an empty path.
 */
class PathNode {
public:
    using ChildMap = std::map<std::string, std::unique_ptr<PathNode>>;

    PathNode(std::string name, std::string path, bool isDirectory);

    PathNode(const PathNode&) = delete;
    PathNode& operator=(const PathNode&) = delete;

    const std::string& name() const { return m_name; }
    const std::string& path() const { return m_path; }
    bool isDirectory() const { return m_isDirectory; }
    bool isRoot() const { return m_path.empty(); }
    void markDirectory() { m_isDirectory = true; }

    PathStats& stats() { return m_stats; }
    const PathStats& stats() const { return m_stats; }

    LoadState loadState() const { return m_loadState; }
    void setLoadState(LoadState state) { m_loadState = state; }
    /** @brief Sets the state of this node and every descendant. */
    void setSubtreeLoadState(LoadState state);

    const ChildMap& children() const { return m_children; }
    PathNode* child(const std::string& name);
    const PathNode* child(const std::string& name) const;

    /** @brief Returns the named child, creating it if missing. */
    PathNode& ensureChild(const std::string& name, bool isDirectory);

    /** @brief Resolves a descendant by relative path ("" is this node). */
    const PathNode* find(const std::string& relativePath) const;
    PathNode* find(const std::string& relativePath);

    /**
     * @brief Replaces the aggregates of this subtree with those of @p computed,
     *        creating nodes that only exist in @p computed.
     */
    void graft(const PathNode& computed);

    std::size_t subtreeSize() const;

private:
    std::string m_name;
    std::string m_path;
    bool m_isDirectory;
    LoadState m_loadState = LoadState::Loaded;
    PathStats m_stats;
    ChildMap m_children;
};

/** @brief Splits "a/b/c" into {"a","b","c"}; empty components are dropped. */
std::vector<std::string> SplitPath(const std::string& path);

/** @brief Joins a parent path and a child name. */
std::string JoinPath(const std::string& parent, const std::string& name);

/** @brief True if @p path is @p prefix or lies below it. The empty prefix covers everything. */
bool IsUnderPrefix(const std::string& path, const std::string& prefix);

} // namespace gitdu::domain

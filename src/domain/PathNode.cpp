/**
 * @file PathNode.cpp
 * @brief Implementation of PathNode and path helpers.
 */

#include "domain/PathNode.hpp"

namespace gitdu::domain {

PathNode::PathNode(std::string name, std::string path, bool isDirectory)
    : m_name(std::move(name)), m_path(std::move(path)), m_isDirectory(isDirectory) {}

void PathNode::setSubtreeLoadState(LoadState state) {
    m_loadState = state;
    for (auto& [name, node] : m_children) {
        node->setSubtreeLoadState(state);
    }
}

PathNode* PathNode::child(const std::string& name) {
    auto it = m_children.find(name);
    return it == m_children.end() ? nullptr : it->second.get();
}

const PathNode* PathNode::child(const std::string& name) const {
    auto it = m_children.find(name);
    return it == m_children.end() ? nullptr : it->second.get();
}

PathNode& PathNode::ensureChild(const std::string& name, bool isDirectory) {
    auto it = m_children.find(name);
    if (it != m_children.end()) {
        // A path can be a file in one commit and a directory in a later one.
        if (isDirectory) it->second->markDirectory();
        return *it->second;
    }
    m_isDirectory = true;
    auto node = std::make_unique<PathNode>(name, JoinPath(m_path, name), isDirectory);
    node->m_loadState = m_loadState;
    PathNode& ref = *node;
    m_children.emplace(name, std::move(node));
    return ref;
}

const PathNode* PathNode::find(const std::string& relativePath) const {
    const PathNode* current = this;
    for (const auto& part : SplitPath(relativePath)) {
        current = current->child(part);
        if (!current) return nullptr;
    }
    return current;
}

PathNode* PathNode::find(const std::string& relativePath) {
    return const_cast<PathNode*>(static_cast<const PathNode*>(this)->find(relativePath));
}

void PathNode::graft(const PathNode& computed) {
    m_stats = computed.m_stats;
    if (computed.m_isDirectory) m_isDirectory = true;
    for (const auto& [name, node] : computed.m_children) {
        ensureChild(name, node->isDirectory()).graft(*node);
    }
}

std::size_t PathNode::subtreeSize() const {
    std::size_t total = 1;
    for (const auto& [name, node] : m_children) {
        total += node->subtreeSize();
    }
    return total;
}

std::vector<std::string> SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) {
            parts.emplace_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return parts;
}

std::string JoinPath(const std::string& parent, const std::string& name) {
    if (parent.empty()) return name;
    return parent + "/" + name;
}

bool IsUnderPrefix(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) return true;
    if (path.size() < prefix.size()) return false;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

} // namespace gitdu::domain

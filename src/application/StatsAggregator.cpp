/**
 * @file StatsAggregator.cpp
 * @brief Implementation of StatsAggregator.
 */

#include "application/StatsAggregator.hpp"

#include <algorithm>

namespace gitdu::application {

using namespace gitdu::domain;

namespace {

std::int64_t KeyValue(const PathStats& stats, SortKey key) {
    switch (key) {
        case SortKey::CommitCount: return static_cast<std::int64_t>(stats.commitCount());
        case SortKey::LatestChange: return stats.latestTimestamp();
        case SortKey::TotalChanges: return stats.totalChanges();
        case SortKey::AuthorCount: return static_cast<std::int64_t>(stats.authorCount());
        default: return 0;
    }
}

} // namespace

StatsAggregator::StatsAggregator() : m_root(std::make_unique<PathNode>("", "", true)) {}

std::string StatsAggregator::EventKey(const std::string& path, const std::string& commitId) {
    std::string key;
    key.reserve(path.size() + commitId.size() + 1);
    key.append(commitId).push_back('\0');
    key.append(path);
    return key;
}

bool StatsAggregator::apply(const ChangeEvent& event) {
    const std::vector<std::string> parts = SplitPath(event.path);
    if (parts.empty()) return false;
    if (!m_applied.insert(EventKey(event.path, event.commitId)).second) return false;

    PathNode* node = m_root.get();
    node->stats().fold(event);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const bool isDirectory = i + 1 < parts.size();
        node = &node->ensureChild(parts[i], isDirectory);
        node->stats().fold(event);
    }
    return true;
}

std::size_t StatsAggregator::applyAll(const std::vector<ChangeEvent>& events) {
    std::size_t applied = 0;
    for (const auto& e : events) {
        if (apply(e)) ++applied;
    }
    return applied;
}

void StatsAggregator::rebuild(const std::vector<ChangeEvent>& events) {
    m_root = std::make_unique<PathNode>("", "", true);
    m_applied.clear();
    applyAll(events);
}

PathNode& StatsAggregator::ensurePath(const std::string& path) {
    const std::vector<std::string> parts = SplitPath(path);
    PathNode* node = m_root.get();
    for (std::size_t i = 0; i < parts.size(); ++i) {
        node = &node->ensureChild(parts[i], i + 1 < parts.size());
    }
    return *node;
}

void StatsAggregator::graft(const std::string& prefix, const StatsAggregator& computed,
                            const std::vector<ChangeEvent>& events) {
    const PathNode* source = computed.find(prefix);
    if (!source) return;

    std::vector<PathNode*> ancestors{m_root.get()};
    const std::vector<std::string> parts = SplitPath(prefix);
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        ancestors.push_back(&ancestors.back()->ensureChild(parts[i], true));
    }
    PathNode& target = prefix.empty() ? *m_root : ensurePath(prefix);
    if (source->isDirectory()) target.markDirectory();
    target.graft(*source);
    if (prefix.empty()) ancestors.clear();

    for (const auto& e : events) {
        if (!IsUnderPrefix(e.path, prefix)) continue;
        if (!m_applied.insert(EventKey(e.path, e.commitId)).second) continue;
        for (PathNode* node : ancestors) {
            node->stats().fold(e);
        }
    }
}

std::vector<const PathNode*> StatsAggregator::SortedChildren(const PathNode& node, SortKey key) {
    std::vector<const PathNode*> result;
    result.reserve(node.children().size());
    for (const auto& [name, child] : node.children()) {
        result.push_back(child.get());
    }

    std::stable_sort(result.begin(), result.end(), [key](const PathNode* a, const PathNode* b) {
        const std::int64_t va = KeyValue(a->stats(), key);
        const std::int64_t vb = KeyValue(b->stats(), key);
        if (va != vb) return va > vb;
        return a->name() < b->name();
    });
    return result;
}

} // namespace gitdu::application

/**
 * @file TreePrinter.cpp
 * @brief Implementation of TreePrinter.
 */

#include "ui/TreePrinter.hpp"

#include <chrono>
#include <cstdio>

#include "ui/UiUtils.hpp"

namespace gitdu::ui {

using application::NodeSnapshot;
using application::ScanStatus;

namespace {

constexpr std::size_t kAuthorWidth = 10;

std::string DisplayName(const NodeSnapshot& node) {
    std::string name = node.name.empty() ? "." : node.name;
    if (node.isDirectory) name += "/";
    return name;
}

} // namespace

TreePrinter::TreePrinter(std::ostream& out, std::int64_t now) : m_out(out), m_now(now) {
    if (m_now == 0) {
        m_now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

std::string TreePrinter::HeaderLine(domain::SortKey key) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "%7s %7s %7s %5s %10s %5s %-*s  %s   (sorted by %s)",
                  "commits", "+ins", "-del", "auth", "latest", "age",
                  static_cast<int>(kAuthorWidth), "by", "path", domain::SortKeyLabel(key).c_str());
    return buf;
}

std::string TreePrinter::formatRow(const NodeSnapshot& node) const {
    if (node.loadState != domain::LoadState::Loaded) {
        const std::string label = node.loadState == domain::LoadState::Loading ? "(loading)" : "(not loaded)";
        char buf[96];
        std::snprintf(buf, sizeof(buf), "%-58s", label.c_str());
        return buf;
    }

    char buf[160];
    std::snprintf(buf, sizeof(buf), "%7s %7s %7s %5zu %10s %5s %-*s",
                  FormatCount(static_cast<std::int64_t>(node.commitCount)).c_str(),
                  ("+" + FormatCount(node.insertions)).c_str(),
                  ("-" + FormatCount(node.deletions)).c_str(),
                  node.authorCount,
                  FormatDate(node.latestTimestamp).c_str(),
                  FormatAge(node.latestTimestamp, m_now).c_str(),
                  static_cast<int>(kAuthorWidth), ShortAuthor(node.latestAuthor, kAuthorWidth).c_str());
    return buf;
}

std::string TreePrinter::StatusLine(const ScanStatus& status) {
    std::string line = "cache: " + (status.cacheState.empty() ? std::string("-") : status.cacheState);
    if (status.lazy) line += ", lazy";
    if (status.scanning) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), ", scanning %llu/%llu commits (%.0f%%)",
                      static_cast<unsigned long long>(status.processed),
                      static_cast<unsigned long long>(status.total), status.progress * 100.0f);
        line += buf;
    } else if (status.stale) {
        line += ", stale";
    }
    if (status.expansionsRunning > 0) {
        line += ", loading " + std::to_string(status.expansionsRunning) + " subtree(s)";
    }
    if (status.error) line += ", error: " + *status.error;
    return line;
}

void TreePrinter::print(const application::NavigationModel& model, const std::string& path, int depth) {
    m_out << HeaderLine(model.sortKey()) << "\n";
    auto node = model.getNode(path);
    if (!node) {
        m_out << "(no such path: " << path << ")\n";
        return;
    }
    m_out << formatRow(*node) << "  " << (path.empty() ? "." : path) << (node->isDirectory ? "/" : "") << "\n";
    if (depth > 0) printChildren(model, path, "", depth);
    m_out.flush();
}

void TreePrinter::printChildren(const application::NavigationModel& model, const std::string& path,
                                const std::string& indent, int depth) {
    const auto children = model.children(path);
    for (std::size_t i = 0; i < children.size(); ++i) {
        const NodeSnapshot& child = children[i];
        const bool last = i + 1 == children.size();
        m_out << formatRow(child) << "  " << indent << (last ? "`-- " : "|-- ") << DisplayName(child) << "\n";
        if (depth > 1 && child.isDirectory && child.loadState == domain::LoadState::Loaded) {
            printChildren(model, child.path, indent + (last ? "    " : "|   "), depth - 1);
        }
    }
}

} // namespace gitdu::ui

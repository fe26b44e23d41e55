/**
 * @file HistoryScanner.cpp
 * @brief Implementation of HistoryScanner.
 */

#include "application/HistoryScanner.hpp"

#include <algorithm>
#include <iostream>

#include "domain/Errors.hpp"
#include "domain/PathNode.hpp"

namespace gitdu::application {

using namespace gitdu::domain;

namespace {

ScanPlan RefreshPlan(std::optional<std::string> head, const std::string& reason) {
    ScanPlan plan;
    plan.liveHead = std::move(head);
    plan.requiresFullRefresh = true;
    plan.refreshReason = reason;
    return plan;
}

ScanSegment MakeSegment(GitDataSource& source, const std::string& base, const std::string& tip) {
    ScanSegment segment;
    segment.base = base;
    segment.tip = tip;
    if (!base.empty()) segment.excludes.push_back(base);
    segment.commits = source.listCommits(tip, segment.excludes, "");
    return segment;
}

} // namespace

HistoryScanner::HistoryScanner(GitDataSource& source, PathFilter filter, const CancellationToken* cancel)
    : m_source(source), m_filter(std::move(filter)), m_cancel(cancel) {}

ScanPlan HistoryScanner::PlanResume(GitDataSource& source, const std::optional<ScanCursor>& cursor) {
    ScanPlan plan;
    plan.liveHead = source.headCommitId();

    if (!plan.liveHead) {
        if (cursor) {
            return RefreshPlan(std::nullopt, "repository has no commits but the cache does");
        }
        return plan;
    }
    const std::string& head = *plan.liveHead;

    if (!cursor) {
        plan.segments.push_back(MakeSegment(source, "", head));
        return plan;
    }

    plan.alreadyProcessed = cursor->processedCount;
    plan.lastProcessedCommitId = cursor->lastProcessedCommitId;
    const std::string& tip = cursor->repoHeadAtScanStart;

    if (tip.empty() || !source.hasCommit(tip)) {
        return RefreshPlan(plan.liveHead, "cached head " + tip + " no longer exists");
    }
    if (tip != head && !source.isAncestor(tip, head)) {
        return RefreshPlan(plan.liveHead, "history was rewritten (cached head " + tip +
                                          " is not an ancestor of " + head + ")");
    }

    if (!cursor->segmentComplete()) {
        if (!cursor->scanBase.empty() && !source.hasCommit(cursor->scanBase)) {
            return RefreshPlan(plan.liveHead, "scan base " + cursor->scanBase + " no longer exists");
        }
        ScanSegment resumed = MakeSegment(source, cursor->scanBase, tip);
        if (!cursor->lastProcessedCommitId.empty()) {
            auto it = std::find(resumed.commits.begin(), resumed.commits.end(), cursor->lastProcessedCommitId);
            if (it == resumed.commits.end()) {
                return RefreshPlan(plan.liveHead, "resume point " + cursor->lastProcessedCommitId +
                                                  " not found in the scan order");
            }
            resumed.commits.erase(resumed.commits.begin(), it + 1);
        }
        plan.segments.push_back(std::move(resumed));
    }

    if (tip != head) {
        plan.segments.push_back(MakeSegment(source, tip, head));
    }
    return plan;
}

ScanPlan HistoryScanner::PlanScoped(GitDataSource& source, const std::string& prefix,
                                    const std::vector<std::string>& coverageHeads) {
    ScanPlan plan;
    plan.liveHead = source.headCommitId();
    if (!plan.liveHead) return plan;

    ScanSegment segment;
    segment.tip = *plan.liveHead;
    segment.pathspec = prefix;
    for (const auto& head : coverageHeads) {
        if (head == segment.tip) {
            // Already covered at the live head.
            return plan;
        }
        if (source.hasCommit(head)) segment.excludes.push_back(head);
    }
    segment.commits = source.listCommits(segment.tip, segment.excludes, prefix);
    plan.segments.push_back(std::move(segment));
    return plan;
}

void HistoryScanner::start(ScanPlan plan) {
    m_plan = std::move(plan);
    m_segmentIndex = 0;
    m_commitIndex = 0;
    m_processed = m_plan.alreadyProcessed;
    m_skipped = 0;
    m_lastCommitId = m_plan.lastProcessedCommitId;
}

ScanCursor HistoryScanner::cursorAfter(const ScanSegment& segment, const std::string& commitId,
                                       bool lastInSegment) const {
    ScanCursor cursor;
    cursor.lastProcessedCommitId = commitId;
    cursor.processedCount = m_processed;
    cursor.repoHeadAtScanStart = segment.tip;
    cursor.scanBase = lastInSegment ? segment.tip : segment.base;
    return cursor;
}

std::optional<ScannedCommit> HistoryScanner::next() {
    while (m_segmentIndex < m_plan.segments.size()) {
        if (cancelled()) return std::nullopt;

        const ScanSegment& segment = m_plan.segments[m_segmentIndex];

        if (segment.commits.empty()) {
            // Nothing left but the completion itself.
            ++m_segmentIndex;
            m_commitIndex = 0;
            ScannedCommit boundary;
            boundary.cursor = cursorAfter(segment, m_lastCommitId, true);
            return boundary;
        }

        const std::string commitId = segment.commits[m_commitIndex];
        const bool last = m_commitIndex + 1 == segment.commits.size();

        ScannedCommit item;
        item.commitId = commitId;
        try {
            CommitRecord record = m_source.readCommit(commitId, segment.pathspec);
            for (const auto& file : record.files) {
                if (!segment.pathspec.empty() && !IsUnderPrefix(file.path, segment.pathspec)) continue;
                if (!m_filter.matches(file.path)) continue;

                ChangeEvent event;
                event.path = file.path;
                event.commitId = commitId;
                event.author = record.author;
                event.timestamp = record.timestamp;
                event.insertions = file.insertions;
                event.deletions = file.deletions;
                item.events.push_back(std::move(event));
            }
        } catch (const CommitReadError& e) {
            std::cerr << "[HistoryScanner] Skipping commit " << commitId << ": " << e.what() << std::endl;
            item.skipped = true;
            item.skipReason = e.what();
            item.events.clear();
            ++m_skipped;
        }

        ++m_processed;
        m_lastCommitId = commitId;
        item.cursor = cursorAfter(segment, commitId, last);

        if (last) {
            ++m_segmentIndex;
            m_commitIndex = 0;
        } else {
            ++m_commitIndex;
        }
        return item;
    }
    return std::nullopt;
}

} // namespace gitdu::application

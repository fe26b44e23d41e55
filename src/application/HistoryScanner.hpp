/**
 * @file HistoryScanner.hpp
 * @brief Turns commit history into per-file change events, oldest first, resumable.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "application/CancellationToken.hpp"
#include "domain/ChangeEvent.hpp"
#include "domain/GitDataSource.hpp"
#include "domain/PathFilter.hpp"
#include "domain/ScanCursor.hpp"

namespace gitdu::application {

/**
 * @struct ScanSegment
 * @brief Commits reachable from @c tip but not from @c excludes, still to be processed.
 */
struct ScanSegment {
    std::string base; ///< Head fully processed before this segment (empty: none).
    std::string tip;
    std::vector<std::string> excludes;
    std::string pathspec;
    std::vector<std::string> commits; ///< Remaining commits, oldest first.
};

/**
 * @struct ScanPlan
 * @brief What a scan has to do to bring the cache up to the live head.
 */
struct ScanPlan {
    std::optional<std::string> liveHead;
    std::vector<ScanSegment> segments;
    std::uint64_t alreadyProcessed = 0; ///< Commits covered by the cursor the plan starts from.
    std::string lastProcessedCommitId;  ///< Resume point of that cursor.
    bool requiresFullRefresh = false;
    std::string refreshReason;

    std::uint64_t pendingCommits() const {
        std::uint64_t total = 0;
        for (const auto& s : segments) total += s.commits.size();
        return total;
    }
    bool upToDate() const { return !requiresFullRefresh && pendingCommits() == 0 && !hasBoundaryOnly(); }

    /** @brief True if a segment has no commit left but its completion was never checkpointed. */
    bool hasBoundaryOnly() const {
        for (const auto& s : segments) {
            if (s.commits.empty()) return true;
        }
        return false;
    }
};

/**
 * @struct ScannedCommit
 * @brief Everything one commit contributes, plus the cursor to store once it is durable.
 */
struct ScannedCommit {
    std::string commitId; ///< Empty for a segment completion without a commit.
    std::vector<domain::ChangeEvent> events;
    bool skipped = false;
    std::string skipReason;
    domain::ScanCursor cursor;
};

/**
 * @class HistoryScanner
 * @brief Pull-based iterator over a ScanPlan.
 *
 * Planning and iteration talk to the data source only; nothing is written here.
 */
class HistoryScanner {
public:
    HistoryScanner(domain::GitDataSource& source, domain::PathFilter filter,
                   const CancellationToken* cancel = nullptr);

    /**
     * @brief Plans a full-history scan that continues from @p cursor.
     * @throws RepositoryAccessError if git cannot be queried.
     */
    static ScanPlan PlanResume(domain::GitDataSource& source, const std::optional<domain::ScanCursor>& cursor);

    /**
     * @brief Plans a scan of the commits touching @p prefix that no head in
     *        @p coverageHeads already accounts for.
     */
    static ScanPlan PlanScoped(domain::GitDataSource& source, const std::string& prefix,
                               const std::vector<std::string>& coverageHeads);

    void start(ScanPlan plan);

    /**
     * @brief Reads the next commit.
     * @return nullopt when the plan is exhausted or cancellation was requested.
     */
    std::optional<ScannedCommit> next();

    bool cancelled() const { return m_cancel && m_cancel->isCancelled(); }
    bool finished() const { return m_segmentIndex >= m_plan.segments.size(); }
    std::uint64_t processed() const { return m_processed; }
    std::uint64_t skipped() const { return m_skipped; }
    const ScanPlan& plan() const { return m_plan; }

private:
    domain::ScanCursor cursorAfter(const ScanSegment& segment, const std::string& commitId, bool lastInSegment) const;

    domain::GitDataSource& m_source;
    domain::PathFilter m_filter;
    const CancellationToken* m_cancel;

    ScanPlan m_plan;
    std::size_t m_segmentIndex = 0;
    std::size_t m_commitIndex = 0;
    std::uint64_t m_processed = 0; ///< Total, including commits from earlier runs.
    std::uint64_t m_skipped = 0;
    std::string m_lastCommitId;
};

} // namespace gitdu::application

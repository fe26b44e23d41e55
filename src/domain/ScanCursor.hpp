/**
 * @file ScanCursor.hpp
 * @brief Durable scan progress marker.
 */

#pragma once

#include <cstdint>
#include <string>

namespace gitdu::domain {

/**
 * @struct ScanCursor
 * @brief Where the history scan stands.
 *
 * The scan walks "segments": the commits reachable from @c repoHeadAtScanStart but not
 * from @c scanBase, oldest first. @c lastProcessedCommitId is the last commit of the
 * current segment whose events (or skip marker) are durable. When the segment is done,
 * @c scanBase equals @c repoHeadAtScanStart.
 */
struct ScanCursor {
    std::string lastProcessedCommitId;
    std::uint64_t processedCount = 0;
    std::string repoHeadAtScanStart;
    std::string scanBase; ///< Head whose entire ancestry is processed; empty before the first complete scan.

    bool segmentComplete() const {
        return !repoHeadAtScanStart.empty() && scanBase == repoHeadAtScanStart;
    }

    bool operator==(const ScanCursor& other) const {
        return lastProcessedCommitId == other.lastProcessedCommitId &&
               processedCount == other.processedCount &&
               repoHeadAtScanStart == other.repoHeadAtScanStart && scanBase == other.scanBase;
    }
    bool operator!=(const ScanCursor& other) const { return !(*this == other); }
};

} // namespace gitdu::domain

/**
 * @file PathStats.cpp
 * @brief Implementation of PathStats.
 */

#include "domain/PathStats.hpp"

namespace gitdu::domain {

bool PathStats::fold(const ChangeEvent& event) {
    const bool wasEmpty = m_latestCommitId.empty();
    const bool firstSeen = m_commits.insert(event.commitId).second;
    m_insertions += event.insertions;
    m_deletions += event.deletions;
    if (!event.author.empty()) {
        m_authors.insert(event.author);
    }

    // Ties go to the later event: application order decides between equal timestamps.
    if (wasEmpty || event.timestamp >= m_latestTimestamp) {
        m_latestTimestamp = event.timestamp;
        m_latestCommitId = event.commitId;
        m_latestAuthor = event.author;
    }
    if (wasEmpty || event.timestamp < m_firstTimestamp) {
        m_firstTimestamp = event.timestamp;
    }
    return firstSeen;
}

bool PathStats::operator==(const PathStats& other) const {
    return m_commits == other.m_commits && m_authors == other.m_authors &&
           m_insertions == other.m_insertions && m_deletions == other.m_deletions &&
           m_latestTimestamp == other.m_latestTimestamp &&
           m_firstTimestamp == other.m_firstTimestamp &&
           m_latestCommitId == other.m_latestCommitId && m_latestAuthor == other.m_latestAuthor;
}

} // namespace gitdu::domain

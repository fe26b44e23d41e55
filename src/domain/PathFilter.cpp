/**
 * @file PathFilter.cpp
 * @brief Implementation of PathFilter.
 */

#include "domain/PathFilter.hpp"

#include <fnmatch.h>

#include "domain/Errors.hpp"
#include "domain/PathNode.hpp"

namespace gitdu::domain {

namespace {

const char* const kDoubleStar = "**";

void ValidateSegment(const std::string& pattern, const std::string& segment) {
    bool inClass = false;
    for (std::size_t i = 0; i < segment.size(); ++i) {
        const char c = segment[i];
        if (c == '\\') {
            if (i + 1 == segment.size()) {
                throw GlobPatternError("dangling escape in glob pattern: " + pattern);
            }
            ++i;
            continue;
        }
        if (!inClass && c == '[') {
            inClass = true;
            // "[]" and "[!]" start with a literal ']'.
            if (i + 1 < segment.size() && (segment[i + 1] == '!' || segment[i + 1] == '^')) ++i;
            if (i + 1 < segment.size() && segment[i + 1] == ']') ++i;
        } else if (inClass && c == ']') {
            inClass = false;
        }
    }
    if (inClass) {
        throw GlobPatternError("unterminated '[' in glob pattern: " + pattern);
    }
}

// "**" glued to other characters behaves like '*'.
std::string CollapseStars(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (char c : segment) {
        if (c == '*' && !out.empty() && out.back() == '*') continue;
        out.push_back(c);
    }
    return out;
}

} // namespace

PathFilter::PathFilter(std::string pattern) : m_pattern(std::move(pattern)) {
    if (m_pattern.empty()) {
        throw GlobPatternError("glob pattern is empty");
    }

    std::string body = m_pattern;
    if (body.front() == '/') {
        m_anchored = true;
        body.erase(0, 1);
    }
    for (const auto& segment : SplitPath(body)) {
        ValidateSegment(m_pattern, segment);
        m_segments.push_back(segment == kDoubleStar ? segment : CollapseStars(segment));
    }
    if (m_segments.empty()) {
        throw GlobPatternError("glob pattern has no path segments: " + m_pattern);
    }

    m_matchAll = true;
    for (std::size_t i = 0; i < m_segments.size(); ++i) {
        const bool last = i + 1 == m_segments.size();
        if (m_segments[i] == kDoubleStar) continue;
        if (last && m_segments[i] == "*") continue;
        m_matchAll = false;
        break;
    }
}

bool PathFilter::matches(const std::string& path) const {
    if (m_matchAll) return true;

    const auto parts = SplitPath(path);
    if (parts.empty()) return false;
    if (m_anchored) {
        return matchFrom(0, parts, 0);
    }
    for (std::size_t start = 0; start < parts.size(); ++start) {
        if (matchFrom(0, parts, start)) return true;
    }
    return false;
}

bool PathFilter::matchFrom(std::size_t patternIndex, const std::vector<std::string>& parts,
                           std::size_t partIndex) const {
    if (patternIndex == m_segments.size()) {
        return partIndex == parts.size();
    }
    const std::string& segment = m_segments[patternIndex];
    if (segment == kDoubleStar) {
        for (std::size_t skip = partIndex; skip <= parts.size(); ++skip) {
            if (matchFrom(patternIndex + 1, parts, skip)) return true;
        }
        return false;
    }
    if (partIndex == parts.size()) return false;
    if (::fnmatch(segment.c_str(), parts[partIndex].c_str(), 0) != 0) return false;
    return matchFrom(patternIndex + 1, parts, partIndex + 1);
}

} // namespace gitdu::domain

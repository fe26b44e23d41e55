/**
 * @file PathFilter.hpp
 * @brief Glob based scope filter applied to file paths before they enter the cache.
 */

#pragma once

#include <string>
#include <vector>

namespace gitdu::domain {

/**
 * @class PathFilter
 * @brief Matches repository-relative paths against a glob pattern.
 *
 * Supported syntax, per '/'-separated segment: '*', '?', '[...]' classes, and "**"
 * as a whole segment matching zero or more segments. A pattern starting with '/' is
 * anchored at the repository root; any other pattern may match a trailing run of
 * segments, so "*.cpp" matches "src/main.cpp". A pattern made of "**" segments and an
 * optional final "*" selects everything.
 */
class PathFilter {
public:
    static constexpr const char* MatchAll = "**/*";

    /**
     * @brief Compiles the pattern.
     * @throws GlobPatternError if the pattern is empty or malformed.
     */
    explicit PathFilter(std::string pattern = MatchAll);

    bool matches(const std::string& path) const;

    const std::string& pattern() const { return m_pattern; }
    bool matchesEverything() const { return m_matchAll; }

private:
    bool matchFrom(std::size_t patternIndex, const std::vector<std::string>& parts, std::size_t partIndex) const;

    std::string m_pattern;
    std::vector<std::string> m_segments;
    bool m_anchored = false;
    bool m_matchAll = false;
};

} // namespace gitdu::domain

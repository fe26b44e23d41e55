/**
 * @file TreePrinter.hpp
 * @brief Plain text rendering of the activity tree (ncdu-style columns).
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "application/NavigationModel.hpp"

namespace gitdu::ui {

/**
 * @class TreePrinter
 * @brief Writes a depth-limited listing of a NavigationModel to a stream.
 */
class TreePrinter {
public:
    explicit TreePrinter(std::ostream& out, std::int64_t now = 0);

    /**
     * @brief Prints @p path and its descendants down to @p depth levels, children
     *        ordered by the model's sort key.
     */
    void print(const application::NavigationModel& model, const std::string& path, int depth);

    /** @brief One status line: cache state, scan progress, error. */
    static std::string StatusLine(const application::ScanStatus& status);

    /** @brief Columns of one node, without indentation. */
    std::string formatRow(const application::NodeSnapshot& node) const;

    static std::string HeaderLine(domain::SortKey key);

private:
    void printChildren(const application::NavigationModel& model, const std::string& path,
                       const std::string& indent, int depth);

    std::ostream& m_out;
    std::int64_t m_now;
};

} // namespace gitdu::ui

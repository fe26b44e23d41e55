#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace gitdu::ui {

/**
 * @brief Converts time_t to tm using platform-specific safe functions.
 */
std::tm ToLocalTime(std::time_t tt);

/**
 * @brief Formats an epoch timestamp as YYYY-MM-DD in local time ("-" for 0).
 */
std::string FormatDate(std::int64_t timestamp);

/**
 * @brief Coarse age relative to @p now: "5m", "3h", "12d", "2y".
 */
std::string FormatAge(std::int64_t timestamp, std::int64_t now);

/**
 * @brief Compact count: 999, 1.2k, 34k, 5.6M.
 */
std::string FormatCount(std::int64_t value);

/**
 * @brief User part of an e-mail, shortened to @p width characters.
 */
std::string ShortAuthor(const std::string& email, std::size_t width);

} // namespace gitdu::ui

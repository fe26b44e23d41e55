#include "ui/UiUtils.hpp"

#include <cstdio>

namespace gitdu::ui {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string FormatDate(std::int64_t timestamp) {
    if (timestamp <= 0) return "-";
    const std::tm tm = ToLocalTime(static_cast<std::time_t>(timestamp));
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::string FormatAge(std::int64_t timestamp, std::int64_t now) {
    if (timestamp <= 0) return "-";
    const std::int64_t age = now > timestamp ? now - timestamp : 0;
    if (age < 3600) return std::to_string(age / 60) + "m";
    if (age < 86400) return std::to_string(age / 3600) + "h";
    if (age < 365 * 86400) return std::to_string(age / 86400) + "d";
    return std::to_string(age / (365 * 86400)) + "y";
}

std::string FormatCount(std::int64_t value) {
    char buf[32];
    if (value < 1000) {
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(value));
    } else if (value < 10000) {
        std::snprintf(buf, sizeof(buf), "%.1fk", static_cast<double>(value) / 1000.0);
    } else if (value < 1000000) {
        std::snprintf(buf, sizeof(buf), "%lldk", static_cast<long long>(value / 1000));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1fM", static_cast<double>(value) / 1000000.0);
    }
    return buf;
}

std::string ShortAuthor(const std::string& email, std::size_t width) {
    std::string name = email.substr(0, email.find('@'));
    if (width > 1 && name.size() > width) {
        name = name.substr(0, width - 1) + "~";
    }
    return name;
}

} // namespace gitdu::ui

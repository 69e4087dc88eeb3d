#include "common/utils.hpp"
#include <cmath>
#include <cstdio>

namespace utils {

std::string formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f %s", value, units[unit]);
    return buffer;
}

std::string formatEta(const std::optional<double>& seconds) {
    if (!seconds) {
        return "ETA ...";
    }
    if (*seconds <= 0.0) {
        return "ETA -";
    }

    uint64_t total = static_cast<uint64_t>(std::ceil(*seconds));
    uint64_t hours = total / 3600;
    uint64_t minutes = (total % 3600) / 60;
    uint64_t secs = total % 60;

    char buffer[48];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "ETA %lluh %02llum",
                      static_cast<unsigned long long>(hours), static_cast<unsigned long long>(minutes));
    } else if (minutes > 0) {
        std::snprintf(buffer, sizeof(buffer), "ETA %llum %02llus",
                      static_cast<unsigned long long>(minutes), static_cast<unsigned long long>(secs));
    } else {
        std::snprintf(buffer, sizeof(buffer), "ETA %llus", static_cast<unsigned long long>(secs));
    }
    return buffer;
}

} // namespace utils

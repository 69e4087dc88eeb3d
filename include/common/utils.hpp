#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace utils {

// "1.50 GB": two decimals, 1024 steps, B through PB.
std::string formatBytes(uint64_t bytes);

// "ETA ..." while unknown, "ETA -" once nothing is left, then
// "ETA 1h 02m", "ETA 3m 04s" or "ETA 9s".
std::string formatEta(const std::optional<double>& seconds);

} // namespace utils

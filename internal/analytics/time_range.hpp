#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace audit::analytics {

inline constexpr const char* kDefaultTimeRange = "7d";

// Window length for an allow-listed range ("1h", "24h", "7d", "30d",
// "90d"); nullopt for anything else.
std::optional<std::chrono::milliseconds> ParseTimeRange(const std::string& range);

const std::vector<std::string>& AllowedTimeRanges();

} // namespace audit::analytics

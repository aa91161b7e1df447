#include "time_range.hpp"

#include <utility>

namespace audit::analytics {

namespace {

using std::chrono::hours;

const std::vector<std::pair<std::string, std::chrono::milliseconds>>& Ranges() {
  static const std::vector<std::pair<std::string, std::chrono::milliseconds>> ranges = {
      {"1h", hours(1)}, {"24h", hours(24)}, {"7d", hours(24 * 7)}, {"30d", hours(24 * 30)}, {"90d", hours(24 * 90)},
  };
  return ranges;
}

} // namespace

std::optional<std::chrono::milliseconds> ParseTimeRange(const std::string& range) {
  for (const auto& [name, length] : Ranges()) {
    if (name == range) return length;
  }
  return std::nullopt;
}

const std::vector<std::string>& AllowedTimeRanges() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& [name, length] : Ranges()) out.push_back(name);
    return out;
  }();
  return names;
}

} // namespace audit::analytics

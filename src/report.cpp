#include "flap_finder/report.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace flap_finder {
namespace {

struct UserBlock {
  std::string device_id;
  std::map<Date, std::vector<std::int64_t>> durations_by_day;
};

std::string join_durations(const std::vector<std::int64_t>& durations) {
  std::string out;
  for (std::size_t i = 0; i < durations.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += fmt::format("{}s", durations[i]);
  }
  return out;
}

}  // namespace

std::string format_date(const Date& date) {
  return fmt::format("{:02}.{:02}.{:04}", date.day, date.month, date.year);
}

std::vector<std::int64_t> shortest_durations(std::vector<std::int64_t> durations,
                                             std::size_t count) {
  const std::size_t limit = std::min(count, durations.size());
  std::partial_sort(durations.begin(), durations.begin() + static_cast<std::ptrdiff_t>(limit),
                    durations.end());
  durations.resize(limit);
  return durations;
}

// Assumes one device per user: the first record seen for a user names the
// device for the whole block.
std::string render_report(const std::vector<Record>& records) {
  std::map<std::string, UserBlock> users;
  for (const Record& record : records) {
    auto [it, inserted] = users.try_emplace(record.user_id);
    if (inserted) {
      it->second.device_id = record.device_id;
    }
    it->second.durations_by_day[record.timestamp.date].push_back(record.duration_seconds);
  }

  std::string report;
  for (const auto& [user, block] : users) {
    if (!report.empty()) {
      report += "\n\n";
    }

    report += fmt::format("{} ({})", user, block.device_id);
    for (const auto& [date, durations] : block.durations_by_day) {
      report += fmt::format("\n{}: {} sessions. Shortest: {}", format_date(date), durations.size(),
                            join_durations(shortest_durations(durations, kShortestSessionsShown)));
    }
  }
  return report;
}

}  // namespace flap_finder

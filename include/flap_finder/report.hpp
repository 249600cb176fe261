#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "flap_finder/record.hpp"

namespace flap_finder {

inline constexpr std::size_t kShortestSessionsShown = 5;

std::string format_date(const Date& date);

std::vector<std::int64_t> shortest_durations(std::vector<std::int64_t> durations,
                                             std::size_t count);

std::string render_report(const std::vector<Record>& records);

}  // namespace flap_finder

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "flap_finder/record.hpp"

namespace flap_finder {

using DayBuckets = std::map<Date, std::vector<Record>>;
using UserDayIndex = std::map<std::string, DayBuckets>;

UserDayIndex group_by_user_and_day(const std::vector<Record>& records);
UserDayIndex group_by_user_and_day(std::vector<Record>&& records);

std::vector<Record> filter_by_duration(std::vector<Record> records,
                                       std::optional<std::int64_t> max_duration);

// Keeps every record of a user that has at least min_daily_count sessions on
// some single day. Users with no such day are dropped entirely.
std::vector<Record> filter_bursts(std::vector<Record> records,
                                  std::optional<std::int64_t> min_daily_count);

}  // namespace flap_finder

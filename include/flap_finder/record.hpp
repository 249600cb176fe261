#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace flap_finder {

struct Date {
  int year = 0;
  int month = 0;
  int day = 0;
};

inline bool operator<(const Date& lhs, const Date& rhs) {
  return std::tie(lhs.year, lhs.month, lhs.day) < std::tie(rhs.year, rhs.month, rhs.day);
}

inline bool operator==(const Date& lhs, const Date& rhs) {
  return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

inline bool operator!=(const Date& lhs, const Date& rhs) { return !(lhs == rhs); }

struct Timestamp {
  Date date;
  int hour = 0;
  int minute = 0;
  int second = 0;
};

inline bool operator==(const Timestamp& lhs, const Timestamp& rhs) {
  return lhs.date == rhs.date && lhs.hour == rhs.hour && lhs.minute == rhs.minute &&
         lhs.second == rhs.second;
}

// One accounting session. user_id is always trimmed and lower-cased.
struct Record {
  Timestamp timestamp;
  std::int64_t duration_seconds = 0;
  std::string device_id;
  std::string user_id;
};

inline bool operator==(const Record& lhs, const Record& rhs) {
  return lhs.timestamp == rhs.timestamp && lhs.duration_seconds == rhs.duration_seconds &&
         lhs.device_id == rhs.device_id && lhs.user_id == rhs.user_id;
}

struct AnalyzeOptions {
  std::string input_path;
  std::optional<std::int64_t> max_duration;
  std::optional<std::int64_t> min_daily_count;
};

}  // namespace flap_finder

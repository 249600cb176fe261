#include "flap_finder/filters.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace flap_finder {

UserDayIndex group_by_user_and_day(const std::vector<Record>& records) {
  UserDayIndex index;
  for (const Record& record : records) {
    index[record.user_id][record.timestamp.date].push_back(record);
  }
  return index;
}

UserDayIndex group_by_user_and_day(std::vector<Record>&& records) {
  UserDayIndex index;
  for (Record& record : records) {
    const Date date = record.timestamp.date;
    index[record.user_id][date].push_back(std::move(record));
  }
  records.clear();
  return index;
}

std::vector<Record> filter_by_duration(std::vector<Record> records,
                                       std::optional<std::int64_t> max_duration) {
  if (!max_duration.has_value()) {
    return records;
  }

  const std::int64_t limit = *max_duration;
  records.erase(std::remove_if(records.begin(), records.end(),
                               [limit](const Record& r) { return r.duration_seconds > limit; }),
                records.end());
  return records;
}

std::vector<Record> filter_bursts(std::vector<Record> records,
                                  std::optional<std::int64_t> min_daily_count) {
  if (!min_daily_count.has_value()) {
    return records;
  }

  const std::int64_t threshold = *min_daily_count;
  const auto has_burst_day = [threshold](const DayBuckets& days) {
    return std::any_of(days.begin(), days.end(), [threshold](const auto& day) {
      return static_cast<std::int64_t>(day.second.size()) >= threshold;
    });
  };

  UserDayIndex index = group_by_user_and_day(std::move(records));

  for (auto& [user, days] : index) {
    if (!has_burst_day(days)) {
      continue;
    }
    for (auto& [date, bucket] : days) {
      std::move(bucket.begin(), bucket.end(), std::back_inserter(records));
    }
  }
  return records;
}

}  // namespace flap_finder

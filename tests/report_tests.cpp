#include "flap_finder/report.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace {

flap_finder::Record make_record(const std::string& user, const std::string& device,
                                flap_finder::Date date, std::int64_t duration) {
  flap_finder::Record record;
  record.user_id = user;
  record.device_id = device;
  record.timestamp.date = date;
  record.duration_seconds = duration;
  return record;
}

}  // namespace

TEST_CASE("format_date pads day and month", "[report]") {
  REQUIRE(flap_finder::format_date({2021, 10, 13}) == "13.10.2021");
  REQUIRE(flap_finder::format_date({2022, 1, 5}) == "05.01.2022");
}

TEST_CASE("shortest_durations returns the smallest values ascending", "[report]") {
  REQUIRE(flap_finder::shortest_durations({5, 1, 9, 3, 3, 7}, 5) ==
          std::vector<std::int64_t>{1, 3, 3, 5, 7});
  REQUIRE(flap_finder::shortest_durations({8, 2}, 5) == std::vector<std::int64_t>{2, 8});
  REQUIRE(flap_finder::shortest_durations({}, 5).empty());
}

TEST_CASE("render_report lists five shortest sessions per day", "[report]") {
  std::vector<flap_finder::Record> records;
  for (const std::int64_t d : {5, 1, 9, 3, 3, 7}) {
    records.push_back(make_record("a@x.com", "dev-a", {2021, 10, 13}, d));
  }

  REQUIRE(flap_finder::render_report(records) ==
          "a@x.com (dev-a)\n"
          "13.10.2021: 6 sessions. Shortest: 1s,3s,3s,5s,7s");
}

TEST_CASE("render_report orders users and days", "[report]") {
  const std::vector<flap_finder::Record> records = {
      make_record("zed", "dev-z", {2021, 10, 14}, 4),
      make_record("amy", "dev-a1", {2021, 10, 14}, 2),
      make_record("amy", "dev-a2", {2021, 9, 30}, 8),
      make_record("amy", "dev-a1", {2021, 10, 14}, 1),
  };

  REQUIRE(flap_finder::render_report(records) ==
          "amy (dev-a1)\n"
          "30.09.2021: 1 sessions. Shortest: 8s\n"
          "14.10.2021: 2 sessions. Shortest: 1s,2s\n"
          "\n"
          "zed (dev-z)\n"
          "14.10.2021: 1 sessions. Shortest: 4s");
}

TEST_CASE("render_report is deterministic", "[report]") {
  std::vector<flap_finder::Record> records;
  for (int i = 0; i < 50; ++i) {
    records.push_back(make_record("user" + std::to_string(i % 7), "dev", {2021, 10, 1 + i % 3}, 50 - i));
  }

  const std::string first = flap_finder::render_report(records);
  const std::string second = flap_finder::render_report(records);

  REQUIRE_FALSE(first.empty());
  REQUIRE(first == second);
}

TEST_CASE("render_report of no records is empty", "[report]") {
  REQUIRE(flap_finder::render_report({}).empty());
}

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flap_finder/record.hpp"

namespace flap_finder {

inline constexpr std::string_view kTimestampField = "Event-Timestamp";
inline constexpr std::string_view kDurationField = "Acct-Session-Time";
inline constexpr std::string_view kDeviceField = "Calling-Station-Id";
inline constexpr std::string_view kUserField = "User-Name";

// Must run once on the main thread before extract_records is used.
void initialize_xml_parser();

// Accepts MM/dd/yyyy HH:mm:ss.
std::optional<Timestamp> parse_event_timestamp(std::string_view raw);
std::optional<std::int64_t> parse_duration(std::string_view raw);
std::string normalize_user_id(std::string_view raw);

// Returns nullopt for any line that is not a complete session event.
std::optional<Record> extract_record(std::string_view line);

// Extracts a batch of lines in parallel. Output keeps input order.
std::vector<Record> extract_records(const std::vector<std::string>& lines);

}  // namespace flap_finder

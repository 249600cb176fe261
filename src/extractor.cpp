#include "flap_finder/extractor.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include <cctype>
#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace flap_finder {
namespace {

constexpr int kXmlParseFlags = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XmlCharDeleter {
  void operator()(xmlChar* text) const { xmlFree(text); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlTextPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string_view trim(std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }

  return input.substr(start, end - start);
}

bool parse_fixed_int(std::string_view input, std::size_t pos, std::size_t len, int& value) {
  if (pos + len > input.size()) {
    return false;
  }

  int out = 0;
  for (std::size_t i = 0; i < len; ++i) {
    const unsigned char ch = static_cast<unsigned char>(input[pos + i]);
    if (std::isdigit(ch) == 0) {
      return false;
    }
    out = out * 10 + (ch - static_cast<unsigned char>('0'));
  }

  value = out;
  return true;
}

bool is_leap_year(int year) {
  if (year % 400 == 0) {
    return true;
  }
  if (year % 100 == 0) {
    return false;
  }
  return year % 4 == 0;
}

int days_in_month(int year, int month) {
  static constexpr int kDaysByMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {
    return 0;
  }
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDaysByMonth[month - 1];
}

bool has_name(const xmlNode* node, std::string_view name) {
  if (node->name == nullptr) {
    return false;
  }
  return std::string_view(reinterpret_cast<const char*>(node->name)) == name;
}

// Depth-first, so the first element in document order wins.
const xmlNode* find_element(const xmlNode* node, std::string_view name) {
  for (const xmlNode* cur = node; cur != nullptr; cur = cur->next) {
    if (cur->type != XML_ELEMENT_NODE) {
      continue;
    }
    if (has_name(cur, name)) {
      return cur;
    }
    if (const xmlNode* found = find_element(cur->children, name); found != nullptr) {
      return found;
    }
  }
  return nullptr;
}

std::optional<std::string> element_text(const xmlNode* root, std::string_view name) {
  const xmlNode* element = find_element(root, name);
  if (element == nullptr) {
    return std::nullopt;
  }

  XmlTextPtr content(xmlNodeGetContent(element));
  if (!content) {
    return std::string{};
  }
  return std::string(reinterpret_cast<const char*>(content.get()));
}

}  // namespace

void initialize_xml_parser() { xmlInitParser(); }

std::optional<Timestamp> parse_event_timestamp(std::string_view raw) {
  const std::string_view input = trim(raw);
  if (input.size() != 19) {
    return std::nullopt;
  }

  if (input[2] != '/' || input[5] != '/' || input[10] != ' ' || input[13] != ':' ||
      input[16] != ':') {
    return std::nullopt;
  }

  Timestamp ts;
  if (!parse_fixed_int(input, 0, 2, ts.date.month) || !parse_fixed_int(input, 3, 2, ts.date.day) ||
      !parse_fixed_int(input, 6, 4, ts.date.year) || !parse_fixed_int(input, 11, 2, ts.hour) ||
      !parse_fixed_int(input, 14, 2, ts.minute) || !parse_fixed_int(input, 17, 2, ts.second)) {
    return std::nullopt;
  }

  if (ts.date.month < 1 || ts.date.month > 12) {
    return std::nullopt;
  }
  if (ts.date.day < 1 || ts.date.day > days_in_month(ts.date.year, ts.date.month)) {
    return std::nullopt;
  }
  if (ts.hour > 23 || ts.minute > 59 || ts.second > 59) {
    return std::nullopt;
  }

  return ts;
}

std::optional<std::int64_t> parse_duration(std::string_view raw) {
  if (raw.empty()) {
    return std::nullopt;
  }

  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  std::int64_t value = 0;
  for (const unsigned char ch : raw) {
    if (std::isdigit(ch) == 0) {
      return std::nullopt;
    }
    const int digit = ch - static_cast<unsigned char>('0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

std::string normalize_user_id(std::string_view raw) {
  const std::string_view trimmed = trim(raw);
  std::string out;
  out.reserve(trimmed.size());
  for (const unsigned char ch : trimmed) {
    out.push_back(static_cast<char>(std::tolower(ch)));
  }
  return out;
}

std::optional<Record> extract_record(std::string_view line) {
  if (trim(line).empty() || line.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }

  XmlDocPtr doc(xmlReadMemory(line.data(), static_cast<int>(line.size()), nullptr, nullptr,
                              kXmlParseFlags));
  if (!doc) {
    return std::nullopt;
  }

  const xmlNode* root = xmlDocGetRootElement(doc.get());
  if (root == nullptr) {
    return std::nullopt;
  }

  const auto timestamp_raw = element_text(root, kTimestampField);
  const auto duration_raw = element_text(root, kDurationField);
  const auto device_raw = element_text(root, kDeviceField);
  const auto user_raw = element_text(root, kUserField);
  if (!timestamp_raw || !duration_raw || !device_raw || !user_raw) {
    return std::nullopt;
  }

  const auto timestamp = parse_event_timestamp(*timestamp_raw);
  const auto duration = parse_duration(*duration_raw);
  if (!timestamp || !duration) {
    return std::nullopt;
  }

  Record record;
  record.timestamp = *timestamp;
  record.duration_seconds = *duration;
  record.device_id = std::string(trim(*device_raw));
  record.user_id = normalize_user_id(*user_raw);
  if (record.user_id.empty() || record.device_id.empty()) {
    return std::nullopt;
  }

  return record;
}

std::vector<Record> extract_records(const std::vector<std::string>& lines) {
  std::vector<std::optional<Record>> slots(lines.size());

  tbb::parallel_for(tbb::blocked_range<std::size_t>(0, lines.size()),
                    [&](const tbb::blocked_range<std::size_t>& range) {
                      for (std::size_t i = range.begin(); i != range.end(); ++i) {
                        slots[i] = extract_record(lines[i]);
                      }
                    });

  std::vector<Record> records;
  records.reserve(slots.size());
  for (auto& slot : slots) {
    if (slot.has_value()) {
      records.push_back(std::move(*slot));
    }
  }
  return records;
}

}  // namespace flap_finder

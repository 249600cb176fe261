#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace flap_finder_test {

inline std::string event_line(std::string_view timestamp, std::string_view duration,
                              std::string_view device, std::string_view user) {
  std::string line = "<Event><Timestamp data_type=\"4\">";
  line += timestamp;
  line += "</Timestamp><Acct-Status-Type data_type=\"0\">2</Acct-Status-Type>";
  line += "<Event-Timestamp data_type=\"4\">";
  line += timestamp;
  line += "</Event-Timestamp><Acct-Session-Time data_type=\"0\">";
  line += duration;
  line += "</Acct-Session-Time><Calling-Station-Id data_type=\"1\">";
  line += device;
  line += "</Calling-Station-Id><User-Name data_type=\"1\">";
  line += user;
  line += "</User-Name></Event>";
  return line;
}

inline std::string write_temp_log(std::string_view name_prefix, std::string_view content) {
  static std::uint64_t counter = 0;
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() /
      (std::string{name_prefix} + "_" + std::to_string(counter++) + ".log");
  std::ofstream out(path, std::ios::binary);
  out << content;
  out.close();
  return path.string();
}

}  // namespace flap_finder_test

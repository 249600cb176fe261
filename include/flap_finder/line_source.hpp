#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace flap_finder {

// Forward-only reader over a log file. The file is opened for shared reading
// only, so another process may keep appending while it is scanned. The handle
// is closed when the LineSource goes out of scope.
class LineSource {
 public:
  explicit LineSource(const std::string& path);

  LineSource(const LineSource&) = delete;
  LineSource& operator=(const LineSource&) = delete;

  bool next(std::string& line);

  // Replaces the contents of out with up to max_lines lines.
  std::size_t next_batch(std::vector<std::string>& out, std::size_t max_lines);

  std::uint64_t lines_read() const { return lines_read_; }

 private:
  std::ifstream in_;
  std::uint64_t lines_read_ = 0;
};

}  // namespace flap_finder

#include "flap_finder/line_source.hpp"

#include <filesystem>
#include <system_error>

#include "flap_finder/errors.hpp"

namespace flap_finder {

LineSource::LineSource(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    throw SourceUnavailable(path);
  }

  // std::ifstream takes no advisory or mandatory lock on POSIX systems.
  in_.open(path, std::ios::in | std::ios::binary);
  if (!in_.is_open()) {
    throw SourceUnavailable(path);
  }
}

bool LineSource::next(std::string& line) {
  if (!std::getline(in_, line)) {
    return false;
  }

  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  ++lines_read_;
  return true;
}

std::size_t LineSource::next_batch(std::vector<std::string>& out, std::size_t max_lines) {
  out.resize(max_lines);

  std::size_t filled = 0;
  while (filled < max_lines && next(out[filled])) {
    ++filled;
  }

  out.resize(filled);
  return filled;
}

}  // namespace flap_finder

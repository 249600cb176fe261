#pragma once

#include <stdexcept>
#include <string>

namespace flap_finder {

// Raised when the input log cannot be opened for reading. Fatal for a run.
class SourceUnavailable : public std::runtime_error {
 public:
  explicit SourceUnavailable(const std::string& path)
      : std::runtime_error("failed to open file: " + path), path_(path) {}

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace flap_finder

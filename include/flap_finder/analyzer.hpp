#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "flap_finder/record.hpp"

namespace flap_finder {

inline constexpr std::size_t kExtractBatchLines = 8192;

struct AnalysisResult {
  std::uint64_t lines_read = 0;
  std::uint64_t records_extracted = 0;
  std::uint64_t records_after_duration_filter = 0;
  std::uint64_t records_reported = 0;
  std::uint64_t users_reported = 0;
  std::string report;
};

class Analyzer {
 public:
  AnalysisResult analyze(const AnalyzeOptions& options) const;
};

std::string run(const AnalyzeOptions& options);

}  // namespace flap_finder

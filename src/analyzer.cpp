#include "flap_finder/analyzer.hpp"

#include <iterator>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "flap_finder/extractor.hpp"
#include "flap_finder/filters.hpp"
#include "flap_finder/line_source.hpp"
#include "flap_finder/report.hpp"

namespace flap_finder {

AnalysisResult Analyzer::analyze(const AnalyzeOptions& options) const {
  if (options.max_duration.has_value() && *options.max_duration < 0) {
    throw std::invalid_argument("session time must be non-negative");
  }
  if (options.min_daily_count.has_value() && *options.min_daily_count < 1) {
    throw std::invalid_argument("session count must be at least 1");
  }

  initialize_xml_parser();

  AnalysisResult result;
  std::vector<Record> kept;

  {
    LineSource source(options.input_path);
    std::vector<std::string> batch;
    while (source.next_batch(batch, kExtractBatchLines) > 0) {
      std::vector<Record> extracted = extract_records(batch);
      result.records_extracted += extracted.size();

      std::vector<Record> short_sessions =
          filter_by_duration(std::move(extracted), options.max_duration);
      kept.insert(kept.end(), std::make_move_iterator(short_sessions.begin()),
                  std::make_move_iterator(short_sessions.end()));
    }
    result.lines_read = source.lines_read();
  }

  result.records_after_duration_filter = kept.size();

  const std::vector<Record> reported = filter_bursts(std::move(kept), options.min_daily_count);
  result.records_reported = reported.size();

  std::set<std::string> users;
  for (const Record& record : reported) {
    users.insert(record.user_id);
  }
  result.users_reported = users.size();

  result.report = render_report(reported);
  return result;
}

std::string run(const AnalyzeOptions& options) {
  const Analyzer analyzer;
  return analyzer.analyze(options).report;
}

}  // namespace flap_finder

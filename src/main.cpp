#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <cstdint>
#include <exception>
#include <string>

#include "flap_finder/analyzer.hpp"

namespace {

void print_counters(const flap_finder::AnalyzeOptions& options,
                    const flap_finder::AnalysisResult& result) {
  fmt::print(stderr, "[flap-finder] file '{}'\n", options.input_path);
  fmt::print(stderr, "  lines_read         = {}\n", result.lines_read);
  fmt::print(stderr, "  records_extracted  = {}\n", result.records_extracted);
  fmt::print(stderr, "  after_session_time = {}\n", result.records_after_duration_filter);
  fmt::print(stderr, "  records_reported   = {}\n", result.records_reported);
  fmt::print(stderr, "  users_reported     = {}\n", result.users_reported);
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"flap-finder: find users with bursts of short RADIUS sessions"};

  flap_finder::AnalyzeOptions options;
  std::int64_t session_time = 0;
  std::int64_t session_count = 0;
  bool verbose = false;

  app.add_option("-f,--file", options.input_path, "RADIUS event log, one XML event per line.")
      ->required();
  auto* time_opt = app.add_option("-t,--sessionTime", session_time,
                                  "Only keep sessions lasting at most this many seconds.")
                       ->check(CLI::NonNegativeNumber);
  auto* count_opt = app.add_option("-c,--sessionCount", session_count,
                                   "Only report users with at least this many sessions on one day.")
                        ->check(CLI::PositiveNumber);
  app.add_flag("-v,--verbose", verbose, "Print pipeline counters to stderr.");

  CLI11_PARSE(app, argc, argv);

  if (time_opt->count() > 0) {
    options.max_duration = session_time;
  }
  if (count_opt->count() > 0) {
    options.min_daily_count = session_count;
  }

  try {
    const flap_finder::Analyzer analyzer;
    const flap_finder::AnalysisResult result = analyzer.analyze(options);

    if (verbose) {
      print_counters(options, result);
    }
    if (!result.report.empty()) {
      fmt::print("{}\n", result.report);
    }
  } catch (const std::exception& e) {
    fmt::print(stderr, "error: {}\n", e.what());
    return 1;
  }

  return 0;
}

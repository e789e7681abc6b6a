#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "loghive/aggregator.hpp"
#include "loghive/partition.hpp"
#include "loghive/types.hpp"

namespace loghive {

struct PipelineOptions {
  std::size_t top_n = kDefaultTopN;
  std::set<std::int32_t> failure_statuses = default_failure_statuses();
  std::int64_t min_failures = kDefaultMinFailures;
  std::size_t jobs = 1;             // parser threads, capped by hardware and input size
  std::ostream* log = &std::cerr;   // warnings; nullptr means silent
};

// Everything one batch produced.
// records and store each hold a copy of every admitted record; a batch is
// expected to fit in memory twice over.
struct Report {
  std::size_t lines_read = 0;
  std::vector<LogRecord> records;   // admitted records, input order
  PartitionedStore store;
  std::vector<SkippedLine> skipped;

  std::int64_t total_requests = 0;
  StatusCounts requests_by_status;
  KeyCounts top_urls;
  KeyCounts top_user_agents;
  KeyCounts failed_ips;
  KeyCounts requests_over_time;
};

enum class Stage {
  Idle,
  Parsing,
  Partitioning,
  Aggregating,
  Done,
  Failed,
};

const char* stage_name(Stage s);

// One batch: parse -> partition -> aggregate. A driver runs exactly once.
class PipelineDriver {
public:
  explicit PipelineDriver(PipelineOptions opts = PipelineOptions{});

  // lines[i] is line number i + 1. Malformed lines are logged and skipped.
  bool run(const std::vector<std::string>& lines, Report& out, std::string* error_out = nullptr);

  // Reads the whole file first; an unreadable file fails before any stage runs.
  bool run_file(const std::string& path, Report& out, std::string* error_out = nullptr);

  Stage stage() const { return stage_; }
  const PipelineOptions& options() const { return opts_; }

private:
  struct ParsedLine {
    std::size_t line_no = 0;
    bool ok = false;
    LogRecord record;
    ParseError error = ParseError::FieldCount;
  };

  std::vector<ParsedLine> parse_all(const std::vector<std::string>& lines) const;
  void warn(const ParsedLine& p, const std::string& raw) const;

  PipelineOptions opts_;
  Stage stage_ = Stage::Idle;
};

} // namespace loghive

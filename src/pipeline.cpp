#include "loghive/pipeline.hpp"

#include <algorithm>
#include <functional>
#include <iterator>
#include <ostream>
#include <system_error>
#include <thread>
#include <utility>

#include "loghive/parser.hpp"

namespace loghive {

// Smaller inputs are not worth a thread.
static const size_t kMinLinesPerJob = 64;

static std::string short_line_preview(const std::string& line) {
  const size_t max_len = 160;
  if (line.size() <= max_len) return line;
  return line.substr(0, max_len) + "...";
}

const char* stage_name(Stage s) {
  switch (s) {
    case Stage::Idle:         return "Idle";
    case Stage::Parsing:      return "Parsing";
    case Stage::Partitioning: return "Partitioning";
    case Stage::Aggregating:  return "Aggregating";
    case Stage::Done:         return "Done";
    case Stage::Failed:       return "Failed";
  }
  return "Unknown";
}

PipelineDriver::PipelineDriver(PipelineOptions opts) : opts_(std::move(opts)) {
  if (opts_.jobs == 0) opts_.jobs = 1;
}

std::vector<PipelineDriver::ParsedLine>
PipelineDriver::parse_all(const std::vector<std::string>& lines) const {
  auto parse_range = [&lines](size_t begin, size_t end, std::vector<ParsedLine>& out) {
    for (size_t i = begin; i < end; ++i) {
      // blank lines are not records
      if (lines[i].empty()) continue;

      ParsedLine p;
      p.line_no = i + 1;
      p.ok = parse_line(lines[i], p.record, &p.error);
      out.push_back(std::move(p));
    }
  };

  size_t jobs = opts_.jobs;
  const unsigned hw = std::thread::hardware_concurrency();
  if (hw > 0) jobs = std::min<size_t>(jobs, hw);
  jobs = std::min(jobs, (lines.size() + kMinLinesPerJob - 1) / kMinLinesPerJob);

  if (jobs <= 1) {
    std::vector<ParsedLine> out;
    out.reserve(lines.size());
    parse_range(0, lines.size(), out);
    return out;
  }

  // Contiguous ranges, one per worker; results carry their line numbers.
  std::vector<std::vector<ParsedLine>> parts(jobs);
  std::vector<std::thread> workers;
  workers.reserve(jobs);

  const size_t chunk = (lines.size() + jobs - 1) / jobs;
  auto range_begin = [&](size_t w) { return std::min(w * chunk, lines.size()); };
  auto range_end = [&](size_t w) { return std::min(range_begin(w) + chunk, lines.size()); };

  size_t started = 0;
  try {
    for (; started < jobs; ++started) {
      workers.emplace_back(parse_range, range_begin(started), range_end(started), std::ref(parts[started]));
    }
  } catch (const std::system_error& e) {
    if (opts_.log) {
      *opts_.log << "Warning: started " << started << " of " << jobs
                 << " parser threads (" << e.what() << "). Parsing the rest on the main thread.\n";
    }
  }

  // Ranges without a worker
  for (size_t w = started; w < jobs; ++w) {
    parse_range(range_begin(w), range_end(w), parts[w]);
  }
  for (auto& t : workers) t.join();

  std::vector<ParsedLine> out;
  out.reserve(lines.size());
  for (auto& part : parts) {
    std::move(part.begin(), part.end(), std::back_inserter(out));
  }
  std::sort(out.begin(), out.end(),
            [](const ParsedLine& a, const ParsedLine& b) { return a.line_no < b.line_no; });
  return out;
}

void PipelineDriver::warn(const ParsedLine& p, const std::string& raw) const {
  if (!opts_.log) return;
  *opts_.log << "Warning: " << parse_error_name(p.error) << " at line " << p.line_no
             << ". Line: " << short_line_preview(raw) << "\n";
}

bool PipelineDriver::run(const std::vector<std::string>& lines, Report& out, std::string* error_out) {
  if (stage_ != Stage::Idle) {
    if (error_out) *error_out = std::string("Pipeline already ran (stage ") + stage_name(stage_) + ").";
    return false;
  }

  Report report;
  report.lines_read = lines.size();

  stage_ = Stage::Parsing;
  std::vector<ParsedLine> parsed = parse_all(lines);
  report.records.reserve(parsed.size());
  for (auto& p : parsed) {
    if (!p.ok) {
      warn(p, lines[p.line_no - 1]);
      report.skipped.push_back(SkippedLine{p.line_no, p.error});
      continue;
    }
    report.records.push_back(std::move(p.record));
  }
  parsed.clear();

  stage_ = Stage::Partitioning;
  report.store = partition(report.records);

  stage_ = Stage::Aggregating;
  report.total_requests = total_requests(report.store);
  report.requests_by_status = requests_by_status(report.store);
  report.top_urls = top_urls(report.records, opts_.top_n);
  report.top_user_agents = top_user_agents(report.records);
  report.failed_ips = failed_ips(report.records, opts_.failure_statuses, opts_.min_failures);
  report.requests_over_time = requests_over_time(report.records);

  out = std::move(report);
  stage_ = Stage::Done;
  return true;
}

bool PipelineDriver::run_file(const std::string& path, Report& out, std::string* error_out) {
  if (stage_ != Stage::Idle) {
    if (error_out) *error_out = std::string("Pipeline already ran (stage ") + stage_name(stage_) + ").";
    return false;
  }

  std::vector<std::string> lines;
  std::string err;
  bool ok = read_lines(
      path,
      [&](std::size_t, const std::string& line) { lines.push_back(line); },
      &err);

  if (!ok) {
    stage_ = Stage::Failed;
    if (error_out) *error_out = err;
    return false;
  }

  return run(lines, out, error_out);
}

} // namespace loghive

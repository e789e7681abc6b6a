#include "loghive/cli.hpp"

#include <cctype>
#include <exception>
#include <fstream>
#include <ostream>
#include <set>
#include <sstream>
#include <string>

#include "loghive/pipeline.hpp"
#include "loghive/report.hpp"

namespace loghive {

static void print_usage(std::ostream& os) {
  os << "Usage:\n"
     << "  loghive analyze --file <path> [--top N] [--fail-statuses s1,s2,...] [--min-failures N]\n"
     << "                  [--jobs N] [--format text|json] [--out <path>] [--partition-dir <dir>]\n"
     << "  loghive --help\n"
     << "  loghive --version\n"
     << "\n"
     << "Input: one record per line, ip,timestamp,url,status,user_agent (no header).\n"
     << "\n"
     << "Options:\n"
     << "  --file <path>           Input log file.\n"
     << "  --top N                 Number of URLs to rank (default 10).\n"
     << "  --fail-statuses list    Statuses counted as failures (default 404,500).\n"
     << "  --min-failures N        Report IPs with more than N failures (default 3).\n"
     << "  --jobs N                Parser threads (default 1).\n"
     << "  --format text|json      Output format (default text).\n"
     << "  --out <path>            Write output to file instead of stdout.\n"
     << "  --partition-dir <dir>   Also write records to <dir>/status=<code>/000000_0.\n"
     << "  --help                  Print this help.\n"
     << "  --version               Print version.\n"
     << "\n"
     << "Examples:\n"
     << "  loghive analyze --file data/access.csv\n"
     << "  loghive analyze --file data/access.csv --top 5 --min-failures 10\n"
     << "  loghive analyze --file data/access.csv --format json --out report.json\n"
     << "  loghive analyze --file data/access.csv --partition-dir warehouse/logs\n";
}

static bool parse_int(const std::string& s, int& out) {
  try {
    size_t idx = 0;
    int v = std::stoi(s, &idx, 10);
    if (idx != s.size()) return false;
    out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

static std::set<std::int32_t> parse_status_list(const std::string& s, bool* ok_out) {
  std::set<std::int32_t> out;
  *ok_out = false;

  std::stringstream ss(s);
  std::string token;
  while (std::getline(ss, token, ',')) {
    size_t start = 0;
    while (start < token.size() && std::isspace(static_cast<unsigned char>(token[start]))) ++start;
    size_t end = token.size();
    while (end > start && std::isspace(static_cast<unsigned char>(token[end - 1]))) --end;
    token = token.substr(start, end - start);

    if (token.empty()) continue;

    int code = 0;
    if (!parse_int(token, code)) return {};
    if (code < 100 || code > 599) return {};
    out.insert(code);
  }

  if (out.empty()) return {};

  *ok_out = true;
  return out;
}

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& log) {
  // Global flags
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(out);
      return 0;
    }
    if (a == "--version") {
      out << "loghive v" << kVersion << "\n";
      return 0;
    }
  }

  if (argc < 2) {
    print_usage(out);
    return 1;
  }

  std::string cmd = argv[1];
  if (cmd != "analyze") {
    log << "Unknown command: " << cmd << "\n";
    print_usage(log);
    return 1;
  }

  std::string file_path;
  std::string format = "text";
  std::string out_path;
  std::string partition_dir;
  PipelineOptions opts;
  opts.log = &log;

  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];

    if (a == "--file" && i + 1 < argc) {
      file_path = argv[++i];
      continue;
    }

    if (a == "--top" && i + 1 < argc) {
      int v = 0;
      if (!parse_int(argv[++i], v) || v <= 0) {
        log << "Invalid --top value (must be a positive integer).\n";
        return 1;
      }
      opts.top_n = static_cast<size_t>(v);
      continue;
    }

    if (a == "--fail-statuses" && i + 1 < argc) {
      bool ok = false;
      opts.failure_statuses = parse_status_list(argv[++i], &ok);
      if (!ok) {
        log << "Invalid --fail-statuses list. Example: --fail-statuses 404,500\n";
        return 1;
      }
      continue;
    }

    if (a == "--min-failures" && i + 1 < argc) {
      int v = 0;
      if (!parse_int(argv[++i], v) || v < 0) {
        log << "Invalid --min-failures value (must be a non-negative integer).\n";
        return 1;
      }
      opts.min_failures = v;
      continue;
    }

    if (a == "--jobs" && i + 1 < argc) {
      int v = 0;
      if (!parse_int(argv[++i], v) || v <= 0) {
        log << "Invalid --jobs value (must be a positive integer).\n";
        return 1;
      }
      opts.jobs = static_cast<size_t>(v);
      continue;
    }

    if (a == "--format" && i + 1 < argc) {
      format = argv[++i];
      if (format != "text" && format != "json") {
        log << "Invalid --format. Use: text or json\n";
        return 1;
      }
      continue;
    }

    if (a == "--out" && i + 1 < argc) {
      out_path = argv[++i];
      continue;
    }

    if (a == "--partition-dir" && i + 1 < argc) {
      partition_dir = argv[++i];
      continue;
    }

    log << "Unknown argument: " << a << "\n";
    print_usage(log);
    return 1;
  }

  if (file_path.empty()) {
    log << "Missing --file <path>\n";
    return 1;
  }

  PipelineDriver driver(opts);
  Report report;
  std::string err;

  if (!driver.run_file(file_path, report, &err)) {
    log << "Error: " << err << "\n";
    return 1;
  }

  // Decide output stream before writing anything else
  std::ofstream fout;
  std::ostream* os = &out;

  if (!out_path.empty()) {
    fout.open(out_path, std::ios::out | std::ios::trunc);
    if (!fout) {
      log << "Error: Failed to open output file: " << out_path << "\n";
      return 1;
    }
    os = &fout;
  }

  if (!partition_dir.empty() && !export_partitions(report.store, partition_dir, &err)) {
    log << "Error: " << err << "\n";
    return 1;
  }

  if (format == "json") {
    write_json_report(*os, report);
  } else {
    *os << "loghive v" << kVersion << "\n";
    write_text_report(*os, report);
  }

  if (!*os) {
    log << "Error: Failed to write report\n";
    return 1;
  }
  return 0;
}

} // namespace loghive

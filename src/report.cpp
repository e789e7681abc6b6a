#include "loghive/report.hpp"

#include <filesystem>
#include <fstream>
#include <ostream>
#include <system_error>

#include "loghive/parser.hpp"

namespace loghive {

const char* const kVersion = "1.0";

// Length of the well-formed UTF-8 sequence starting at s[i], or 0.
static size_t utf8_sequence_length(const std::string& s, size_t i) {
  const unsigned char c = static_cast<unsigned char>(s[i]);

  size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xbf;
  if (c >= 0xc2 && c <= 0xdf) {
    len = 2;
  } else if (c >= 0xe0 && c <= 0xef) {
    len = 3;
    if (c == 0xe0) lo = 0xa0;      // overlong
    if (c == 0xed) hi = 0x9f;      // surrogates
  } else if (c >= 0xf0 && c <= 0xf4) {
    len = 4;
    if (c == 0xf0) lo = 0x90;      // overlong
    if (c == 0xf4) hi = 0x8f;      // above U+10FFFF
  } else {
    return 0;
  }

  if (i + len > s.size()) return 0;
  for (size_t k = 1; k < len; ++k) {
    const unsigned char cc = static_cast<unsigned char>(s[i + k]);
    if (k == 1 ? (cc < lo || cc > hi) : (cc < 0x80 || cc > 0xbf)) return 0;
  }
  return len;
}

// Malformed UTF-8 bytes become U+FFFD, one per byte.
std::string json_escape(const std::string& s) {
  static const char* kHex = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 8);
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: {
        const unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20) {
          out += "\\u00";
          out += kHex[(u >> 4) & 0x0f];
          out += kHex[u & 0x0f];
        } else if (u < 0x80) {
          out += c;
        } else {
          const size_t len = utf8_sequence_length(s, i);
          if (len == 0) {
            out += "\\ufffd";
          } else {
            out.append(s, i, len);
            i += len - 1;
          }
        }
      }
    }
  }
  return out;
}

static void write_key_counts_text(std::ostream& os, const KeyCounts& rows) {
  if (rows.empty()) {
    os << "  (none)\n";
    return;
  }
  for (const auto& kv : rows) {
    os << "  " << kv.first << ": " << kv.second << "\n";
  }
}

void write_text_report(std::ostream& os, const Report& report) {
  os << "\n=== REPORT ===\n";
  os << "Lines read: " << report.lines_read << "\n";
  os << "Skipped lines: " << report.skipped.size() << "\n";
  os << "Total requests: " << report.total_requests << "\n";

  os << "\nRequests by status:\n";
  if (report.requests_by_status.empty()) os << "  (none)\n";
  for (const auto& kv : report.requests_by_status) {
    os << "  " << kv.first << ": " << kv.second << "\n";
  }

  os << "\nTop URLs:\n";
  write_key_counts_text(os, report.top_urls);

  os << "\nTop user agents:\n";
  write_key_counts_text(os, report.top_user_agents);

  os << "\nFailed IPs:\n";
  write_key_counts_text(os, report.failed_ips);

  os << "\nRequests over time:\n";
  write_key_counts_text(os, report.requests_over_time);

  if (!report.skipped.empty()) {
    os << "\nSkipped:\n";
    for (const auto& s : report.skipped) {
      os << "  line " << s.line_no << ": " << parse_error_name(s.error) << "\n";
    }
  }
}

static void write_key_counts_json(std::ostream& os,
                                  const char* name,
                                  const char* key_field,
                                  const KeyCounts& rows,
                                  bool trailing_comma) {
  os << "  \"" << name << "\": [";
  if (rows.empty()) {
    os << "]" << (trailing_comma ? ",\n" : "\n");
    return;
  }
  os << "\n";
  for (size_t i = 0; i < rows.size(); ++i) {
    os << "    {\"" << key_field << "\": \"" << json_escape(rows[i].first)
       << "\", \"count\": " << rows[i].second << "}";
    os << (i + 1 < rows.size() ? ",\n" : "\n");
  }
  os << "  ]" << (trailing_comma ? ",\n" : "\n");
}

void write_json_report(std::ostream& os, const Report& report) {
  os << "{\n";
  os << "  \"version\": \"" << kVersion << "\",\n";
  os << "  \"lines_read\": " << report.lines_read << ",\n";
  os << "  \"total_requests\": " << report.total_requests << ",\n";

  os << "  \"requests_by_status\": [";
  if (!report.requests_by_status.empty()) os << "\n";
  size_t i = 0;
  for (const auto& kv : report.requests_by_status) {
    os << "    {\"status\": " << kv.first << ", \"count\": " << kv.second << "}";
    os << (++i < report.requests_by_status.size() ? ",\n" : "\n");
  }
  os << (report.requests_by_status.empty() ? "],\n" : "  ],\n");

  write_key_counts_json(os, "top_urls", "url", report.top_urls, true);
  write_key_counts_json(os, "top_user_agents", "user_agent", report.top_user_agents, true);
  write_key_counts_json(os, "failed_ips", "ip", report.failed_ips, true);
  write_key_counts_json(os, "requests_over_time", "minute", report.requests_over_time, true);

  os << "  \"skipped\": [";
  if (!report.skipped.empty()) os << "\n";
  for (size_t j = 0; j < report.skipped.size(); ++j) {
    const auto& s = report.skipped[j];
    os << "    {\"line\": " << s.line_no << ", \"error\": \"" << parse_error_name(s.error) << "\"}";
    os << (j + 1 < report.skipped.size() ? ",\n" : "\n");
  }
  os << (report.skipped.empty() ? "]\n" : "  ]\n");
  os << "}\n";
}

bool export_partitions(const PartitionedStore& store,
                       const std::string& dir,
                       std::string* error_out) {
  namespace fs = std::filesystem;

  for (const auto& kv : store.partitions()) {
    const fs::path part_dir = fs::path(dir) / ("status=" + std::to_string(kv.first));

    std::error_code ec;
    fs::create_directories(part_dir, ec);
    if (ec) {
      if (error_out) *error_out = "Failed to create directory: " + part_dir.string() + " (" + ec.message() + ")";
      return false;
    }

    const fs::path file = part_dir / "000000_0";
    std::ofstream out(file, std::ios::out | std::ios::trunc);
    if (!out) {
      if (error_out) *error_out = "Failed to open output file: " + file.string();
      return false;
    }
    for (const auto& r : kv.second) out << to_line(r) << "\n";

    if (!out) {
      if (error_out) *error_out = "Failed to write: " + file.string();
      return false;
    }
  }
  return true;
}

} // namespace loghive

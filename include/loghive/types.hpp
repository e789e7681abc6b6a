#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace loghive {

// One parsed access-log line: ip,timestamp,url,status,user_agent
struct LogRecord {
  std::string ip;
  std::string timestamp;   // "YYYY-MM-DD HH:MM:SS", kept as raw string
  std::string url;
  std::int32_t status = 0; // 100..599
  std::string user_agent;
};

enum class ParseError {
  FieldCount,
  InvalidStatus,
  ShortTimestamp,
};

// A line the pipeline skipped. line_no is 1-based.
struct SkippedLine {
  std::size_t line_no = 0;
  ParseError error = ParseError::FieldCount;
};

} // namespace loghive

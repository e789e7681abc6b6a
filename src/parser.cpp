#include "loghive/parser.hpp"

#include <cctype>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace loghive {

// Plain splitter: no quoting, no trimming. "a,,b" yields three fields.
static void split_line(const std::string& line, std::vector<std::string>& out) {
  out.clear();

  std::string field;
  for (char c : line) {
    if (c == kDelimiter) {
      out.push_back(field);
      field.clear();
      continue;
    }
    field.push_back(c);
  }
  out.push_back(field);
}

// Exactly three ASCII digits, value in [100, 599]
static bool to_status(const std::string& s, std::int32_t& out) {
  if (s.size() != 3) return false;

  std::int32_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
  }
  if (v < 100 || v > 599) return false;

  out = v;
  return true;
}

bool parse_line(const std::string& line, LogRecord& out, ParseError* err_out) {
  std::vector<std::string> cols;
  cols.reserve(kFieldCount);
  split_line(line, cols);

  if (cols.size() != kFieldCount) {
    if (err_out) *err_out = ParseError::FieldCount;
    return false;
  }

  std::int32_t status = 0;
  if (!to_status(cols[3], status)) {
    if (err_out) *err_out = ParseError::InvalidStatus;
    return false;
  }

  if (cols[1].size() < kMinuteBucketLen) {
    if (err_out) *err_out = ParseError::ShortTimestamp;
    return false;
  }

  out.ip = std::move(cols[0]);
  out.timestamp = std::move(cols[1]);
  out.url = std::move(cols[2]);
  out.status = status;
  out.user_agent = std::move(cols[4]);
  return true;
}

std::string to_line(const LogRecord& r) {
  std::string line;
  line.reserve(r.ip.size() + r.timestamp.size() + r.url.size() + r.user_agent.size() + 7);
  line += r.ip;
  line += kDelimiter;
  line += r.timestamp;
  line += kDelimiter;
  line += r.url;
  line += kDelimiter;
  line += std::to_string(r.status);
  line += kDelimiter;
  line += r.user_agent;
  return line;
}

bool minute_bucket(const std::string& timestamp, std::string& out, ParseError* err_out) {
  if (timestamp.size() < kMinuteBucketLen) {
    if (err_out) *err_out = ParseError::ShortTimestamp;
    return false;
  }
  out = timestamp.substr(0, kMinuteBucketLen);
  return true;
}

const char* parse_error_name(ParseError err) {
  switch (err) {
    case ParseError::FieldCount:     return "FieldCount";
    case ParseError::InvalidStatus:  return "InvalidStatus";
    case ParseError::ShortTimestamp: return "ShortTimestamp";
  }
  return "Unknown";
}

bool read_lines(const std::string& path,
                const std::function<void(std::size_t, const std::string&)>& on_line,
                std::string* error_out) {
  std::ifstream in(path);
  if (!in) {
    if (error_out) *error_out = "Failed to open file: " + path;
    return false;
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    // CRLF input
    if (!line.empty() && line.back() == '\r') line.pop_back();
    on_line(line_no, line);
  }

  if (in.bad()) {
    if (error_out) *error_out = "Read error in file: " + path;
    return false;
  }
  return true;
}

} // namespace loghive

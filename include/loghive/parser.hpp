#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "loghive/types.hpp"

namespace loghive {

constexpr char kDelimiter = ',';
constexpr std::size_t kFieldCount = 5;
constexpr std::size_t kMinuteBucketLen = 16; // "YYYY-MM-DD HH:MM"

// Parses one raw line. Fields are taken verbatim, no trimming or quoting.
// On failure returns false and sets *err_out (if given); out is left untouched.
bool parse_line(const std::string& line, LogRecord& out, ParseError* err_out = nullptr);

// Re-serializes a record; inverse of parse_line for every valid line.
std::string to_line(const LogRecord& r);

// First 16 characters of the timestamp.
bool minute_bucket(const std::string& timestamp, std::string& out, ParseError* err_out = nullptr);

const char* parse_error_name(ParseError err);

// Calls on_line(line_no, line) for every line in the file, '\r' stripped.
bool read_lines(const std::string& path,
                const std::function<void(std::size_t, const std::string&)>& on_line,
                std::string* error_out = nullptr);

} // namespace loghive

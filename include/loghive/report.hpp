#pragma once

#include <iosfwd>
#include <string>

#include "loghive/partition.hpp"
#include "loghive/pipeline.hpp"

namespace loghive {

extern const char* const kVersion;

// Escapes for a JSON string; malformed UTF-8 bytes become \ufffd.
std::string json_escape(const std::string& s);

void write_text_report(std::ostream& os, const Report& report);
void write_json_report(std::ostream& os, const Report& report);

// Hive-style layout: <dir>/status=<code>/000000_0, one line per record.
bool export_partitions(const PartitionedStore& store,
                       const std::string& dir,
                       std::string* error_out = nullptr);

} // namespace loghive

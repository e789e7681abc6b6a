#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "loghive/partition.hpp"
#include "loghive/types.hpp"

namespace loghive {

using KeyCount = std::pair<std::string, std::int64_t>;
using KeyCounts = std::vector<KeyCount>;
using StatusCounts = std::map<std::int32_t, std::int64_t>;

constexpr std::size_t kDefaultTopN = 10;
constexpr std::int64_t kDefaultMinFailures = 3;

// Statuses failed_ips filters on unless told otherwise.
const std::set<std::int32_t>& default_failure_statuses();

// Counts occurrences per key, remembering the order keys were first seen.
class GroupCounter {
public:
  void add(const std::string& key);

  std::size_t size() const { return order_.size(); }

  // Count descending; equal counts keep first-seen order.
  KeyCounts ranked() const;

  // Ascending by key.
  KeyCounts sorted_by_key() const;

private:
  std::unordered_map<std::string, std::size_t> index_; // key -> slot in order_
  KeyCounts order_;
};

std::int64_t total_requests(const std::vector<LogRecord>& records);
std::int64_t total_requests(const PartitionedStore& store);

StatusCounts requests_by_status(const std::vector<LogRecord>& records);
StatusCounts requests_by_status(const PartitionedStore& store);

KeyCounts top_urls(const std::vector<LogRecord>& records, std::size_t n = kDefaultTopN);

// Full ranking, no limit.
KeyCounts top_user_agents(const std::vector<LogRecord>& records);

// IPs with more than min_count requests (strictly) among records whose status
// is in statuses. Count descending, ties in first-seen order.
KeyCounts failed_ips(const std::vector<LogRecord>& records,
                     const std::set<std::int32_t>& statuses = default_failure_statuses(),
                     std::int64_t min_count = kDefaultMinFailures);

// Same, but only scans the partitions named in statuses (ascending status).
KeyCounts failed_ips(const PartitionedStore& store,
                     const std::set<std::int32_t>& statuses = default_failure_statuses(),
                     std::int64_t min_count = kDefaultMinFailures);

// Per-minute counts ("YYYY-MM-DD HH:MM"), ascending by bucket. A record whose
// timestamp is shorter than 16 characters has no bucket and is not counted;
// parse_line never produces one.
KeyCounts requests_over_time(const std::vector<LogRecord>& records);

} // namespace loghive

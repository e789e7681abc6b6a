#include "loghive/aggregator.hpp"

#include <algorithm>

#include "loghive/parser.hpp"

namespace loghive {

const std::set<std::int32_t>& default_failure_statuses() {
  static const std::set<std::int32_t> kStatuses = {404, 500};
  return kStatuses;
}

void GroupCounter::add(const std::string& key) {
  auto it = index_.find(key);
  if (it == index_.end()) {
    index_.emplace(key, order_.size());
    order_.emplace_back(key, 1);
    return;
  }
  ++order_[it->second].second;
}

KeyCounts GroupCounter::ranked() const {
  KeyCounts out = order_;
  std::stable_sort(out.begin(), out.end(),
                   [](const KeyCount& a, const KeyCount& b) { return a.second > b.second; });
  return out;
}

KeyCounts GroupCounter::sorted_by_key() const {
  KeyCounts out = order_;
  std::sort(out.begin(), out.end(),
            [](const KeyCount& a, const KeyCount& b) { return a.first < b.first; });
  return out;
}

std::int64_t total_requests(const std::vector<LogRecord>& records) {
  return static_cast<std::int64_t>(records.size());
}

std::int64_t total_requests(const PartitionedStore& store) {
  return static_cast<std::int64_t>(store.record_count());
}

StatusCounts requests_by_status(const std::vector<LogRecord>& records) {
  StatusCounts out;
  for (const auto& r : records) ++out[r.status];
  return out;
}

StatusCounts requests_by_status(const PartitionedStore& store) {
  StatusCounts out;
  for (const auto& kv : store.partitions()) {
    out[kv.first] = static_cast<std::int64_t>(kv.second.size());
  }
  return out;
}

KeyCounts top_urls(const std::vector<LogRecord>& records, std::size_t n) {
  GroupCounter urls;
  for (const auto& r : records) urls.add(r.url);

  KeyCounts out = urls.ranked();
  if (out.size() > n) out.resize(n);
  return out;
}

KeyCounts top_user_agents(const std::vector<LogRecord>& records) {
  GroupCounter agents;
  for (const auto& r : records) agents.add(r.user_agent);
  return agents.ranked();
}

static KeyCounts over_threshold(const GroupCounter& ips, std::int64_t min_count) {
  KeyCounts out = ips.ranked();
  out.erase(std::remove_if(out.begin(), out.end(),
                           [min_count](const KeyCount& kc) { return kc.second <= min_count; }),
            out.end());
  return out;
}

KeyCounts failed_ips(const std::vector<LogRecord>& records,
                     const std::set<std::int32_t>& statuses,
                     std::int64_t min_count) {
  GroupCounter ips;
  for (const auto& r : records) {
    if (statuses.count(r.status)) ips.add(r.ip);
  }
  return over_threshold(ips, min_count);
}

KeyCounts failed_ips(const PartitionedStore& store,
                     const std::set<std::int32_t>& statuses,
                     std::int64_t min_count) {
  GroupCounter ips;
  for (std::int32_t status : statuses) {
    const auto* bucket = store.find(status);
    if (!bucket) continue;
    for (const auto& r : *bucket) ips.add(r.ip);
  }
  return over_threshold(ips, min_count);
}

KeyCounts requests_over_time(const std::vector<LogRecord>& records) {
  GroupCounter minutes;
  std::string bucket;
  for (const auto& r : records) {
    // parse_line admits no record with a short timestamp
    if (!minute_bucket(r.timestamp, bucket)) continue;
    minutes.add(bucket);
  }
  return minutes.sorted_by_key();
}

} // namespace loghive

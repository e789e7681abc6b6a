#include "loghive/partition.hpp"

#include <utility>

namespace loghive {

void PartitionedStore::add(const LogRecord& r) {
  buckets_[r.status].push_back(r);
  ++records_;
}

void PartitionedStore::add(LogRecord&& r) {
  auto& bucket = buckets_[r.status];
  bucket.push_back(std::move(r));
  ++records_;
}

const PartitionedStore::Bucket* PartitionedStore::find(std::int32_t status) const {
  auto it = buckets_.find(status);
  if (it == buckets_.end()) return nullptr;
  return &it->second;
}

std::vector<std::int32_t> PartitionedStore::keys() const {
  std::vector<std::int32_t> out;
  out.reserve(buckets_.size());
  for (const auto& kv : buckets_) out.push_back(kv.first);
  return out;
}

PartitionedStore partition(const std::vector<LogRecord>& records) {
  PartitionedStore store;
  for (const auto& r : records) store.add(r);
  return store;
}

} // namespace loghive

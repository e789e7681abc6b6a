#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "loghive/types.hpp"

namespace loghive {

// Records bucketed by status code. Keys are discovered from the data;
// iteration is in ascending status order, insertion order within a bucket.
class PartitionedStore {
public:
  using Bucket = std::vector<LogRecord>;

  void add(const LogRecord& r);
  void add(LogRecord&& r);

  // nullptr if no record carried this status
  const Bucket* find(std::int32_t status) const;

  std::size_t record_count() const { return records_; }
  std::size_t partition_count() const { return buckets_.size(); }
  std::vector<std::int32_t> keys() const;

  const std::map<std::int32_t, Bucket>& partitions() const { return buckets_; }

private:
  std::map<std::int32_t, Bucket> buckets_;
  std::size_t records_ = 0;
};

PartitionedStore partition(const std::vector<LogRecord>& records);

} // namespace loghive

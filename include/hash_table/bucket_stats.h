#pragma once

#include <cmath>
#include <cstddef>
#include <iostream>

// Chain length statistics of a table, lower std_dev means a more uniform hash
struct BucketStats {
  size_t buckets = 0;
  size_t entries = 0;
  size_t empty_buckets = 0;
  size_t longest_chain = 0;
  double mean = 0.0;
  double std_dev = 0.0;

  void dump(std::ostream& out) const {
    out << "buckets: " << buckets
        << ", entries: " << entries
        << ", empty: " << empty_buckets
        << ", longest chain: " << longest_chain
        << ", mean: " << mean
        << ", std dev: " << std_dev << "\n";
  }
};

template <typename Table>
BucketStats analyze_buckets(const Table& table) {
  BucketStats stats;
  stats.buckets = table.get_capacity();
  stats.entries = table.get_count();
  stats.mean = (double)stats.entries / stats.buckets;

  double variance = 0.0;
  for (size_t i = 0; i < stats.buckets; ++i) {
    size_t length = table.bucket_size(i);
    if (length == 0) {
      stats.empty_buckets++;
    }
    if (length > stats.longest_chain) {
      stats.longest_chain = length;
    }
    double diff = (double)length - stats.mean;
    variance += diff * diff;
  }

  stats.std_dev = std::sqrt(variance / stats.buckets);
  return stats;
}

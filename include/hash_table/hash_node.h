#pragma once

#include <cstdint>
#include <memory>
#include <utility>

// One key/value pair of a bucket chain. Each node is owned by its predecessor
// (the bucket head or the previous node).
template <typename K, typename V>
struct HashNode {
  K key;
  V value;
  uint64_t hash_code; // raw hash of key, reused when relinking on resize
  std::unique_ptr<HashNode<K, V>> next;

  HashNode(const K& k, const V& v, uint64_t h)
    : key(k), value(v), hash_code(h), next(nullptr) {}
};

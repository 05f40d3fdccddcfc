#pragma once

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "hash_table/hash_node.h"
#include "hash_table/hash_functions.h"

// Separate chaining hash table that doubles its bucket array whenever a new
// key would push count / capacity above the load factor threshold.
// Not thread safe, callers serialize access themselves.
template <typename K, typename V, typename Hash = XXHash64Hasher<K>, typename KeyEqual = std::equal_to<K>>
class ChainedHashTable {
private:
  using Node = HashNode<K, V>;
  using Bucket = std::unique_ptr<Node>;

  // Hash table variables
  std::vector<Bucket> table;
  size_t capacity;
  size_t count;
  double load_factor_threshold;

  Hash hasher;
  KeyEqual key_equal;

  uint64_t get_raw_hash(const K& key) const {
    return static_cast<uint64_t>(hasher(key));
  }

  static size_t get_bucket_index(uint64_t raw_hash, size_t cap) {
    return raw_hash % cap;
  }

  Node *find_node(const K& key, uint64_t raw_hash) const {
    Node *current = table[get_bucket_index(raw_hash, capacity)].get();
    while (current != nullptr) {
      // compare cached hashes first, equality can be expensive
      if (current->hash_code == raw_hash && key_equal(current->key, key)) {
        return current;
      }
      current = current->next.get();
    }
    return nullptr;
  }

  // Smallest doubling of the capacity that keeps `needed` entries under the threshold.
  // Throws std::length_error when that capacity is not representable.
  size_t grow_capacity(size_t needed) const {
    size_t new_capacity = capacity;
    do {
      if (new_capacity > std::numeric_limits<size_t>::max() / 2) {
        throw std::length_error("ChainedHashTable: capacity overflow, load factor threshold too small");
      }
      new_capacity *= 2;
    } while ((double)needed / new_capacity > load_factor_threshold);
    return new_capacity;
  }

  // The bucket array allocation is the only step that can throw. Relinking
  // uses the cached hash codes and moves pointers only, so a failed resize
  // leaves the table exactly as it was.
  void resize(size_t new_capacity) {
    std::vector<Bucket> temp_table(new_capacity);

    for (Bucket& bucket : table) {
      Bucket current = std::move(bucket);
      while (current) {
        Bucket next = std::move(current->next);
        size_t new_index = get_bucket_index(current->hash_code, new_capacity);
        current->next = std::move(temp_table[new_index]);
        temp_table[new_index] = std::move(current);
        current = std::move(next);
      }
    }

    table = std::move(temp_table);
    capacity = new_capacity;
  }

  // Unlinks one node at a time, a long chain would otherwise be destroyed recursively
  static void release_chain(Bucket& head) {
    while (head) {
      head = std::move(head->next);
    }
  }

public:
  explicit ChainedHashTable(size_t initial_capacity = 7, double max_load_factor = 0.75,
                            const Hash& hash = Hash(), const KeyEqual& equal = KeyEqual())
    : capacity(initial_capacity),
      count(0),
      load_factor_threshold(max_load_factor),
      hasher(hash),
      key_equal(equal)
  {
    if (initial_capacity == 0) {
      throw std::invalid_argument("ChainedHashTable: capacity must be positive");
    }
    if (!std::isfinite(max_load_factor) || max_load_factor <= 0.0) {
      throw std::invalid_argument("ChainedHashTable: load factor threshold must be positive");
    }
    table.resize(capacity);
  }

  ChainedHashTable(const ChainedHashTable&) = delete;
  ChainedHashTable& operator=(const ChainedHashTable&) = delete;

  ~ChainedHashTable() {
    clear();
  }

  // Inserts or updates key. Returns the replaced value on update, std::nullopt
  // when a new entry was created.
  std::optional<V> insert(const K& key, const V& value) {
    uint64_t raw_hash = get_raw_hash(key);

    // Check if key exists to update, updates never resize
    Node *existing = find_node(key, raw_hash);
    if (existing != nullptr) {
      V previous = existing->value;
      existing->value = value;
      return previous;
    }

    // Resize before linking, the bucket is then computed from the new capacity
    if ((double)(count + 1) / capacity > load_factor_threshold) {
      resize(grow_capacity(count + 1));
    }

    // If not found, insert at the end of the bucket (handle collision)
    Bucket *slot = &table[get_bucket_index(raw_hash, capacity)];
    while (*slot) {
      slot = &(*slot)->next;
    }
    *slot = std::make_unique<Node>(key, value, raw_hash);
    count++;
    return std::nullopt;
  }

  // std::nullopt when the key is not present
  std::optional<V> search(const K& key) const {
    const Node *node = find_node(key, get_raw_hash(key));
    if (node == nullptr) {
      return std::nullopt;
    }
    return node->value;
  }

  bool contains(const K& key) const {
    return find_node(key, get_raw_hash(key)) != nullptr;
  }

  // Unlinks the entry and returns its value, std::nullopt when the key is not present.
  // The table never shrinks.
  std::optional<V> remove(const K& key) {
    uint64_t raw_hash = get_raw_hash(key);
    Bucket *link = &table[get_bucket_index(raw_hash, capacity)];

    while (*link) {
      if ((*link)->hash_code == raw_hash && key_equal((*link)->key, key)) {
        Bucket removed = std::move(*link);
        *link = std::move(removed->next);
        count--;
        return std::move(removed->value);
      }
      link = &(*link)->next;
    }

    return std::nullopt;
  }

  // Drops every entry, the capacity is kept
  void clear() {
    for (Bucket& bucket : table) {
      release_chain(bucket);
    }
    count = 0;
  }

  // Snapshots in bucket order, chain order within a bucket
  std::vector<K> get_all_keys() const {
    std::vector<K> keys;
    keys.reserve(count);
    for (const Bucket& bucket : table) {
      for (const Node *node = bucket.get(); node != nullptr; node = node->next.get()) {
        keys.push_back(node->key);
      }
    }
    return keys;
  }

  std::vector<V> get_all_values() const {
    std::vector<V> values;
    values.reserve(count);
    for (const Bucket& bucket : table) {
      for (const Node *node = bucket.get(); node != nullptr; node = node->next.get()) {
        values.push_back(node->value);
      }
    }
    return values;
  }

  std::vector<std::pair<K, V>> get_all_items() const {
    std::vector<std::pair<K, V>> items;
    items.reserve(count);
    for (const Bucket& bucket : table) {
      for (const Node *node = bucket.get(); node != nullptr; node = node->next.get()) {
        items.emplace_back(node->key, node->value);
      }
    }
    return items;
  }

  // Chain length of one bucket
  size_t bucket_size(size_t index) const {
    size_t length = 0;
    for (const Node *node = table.at(index).get(); node != nullptr; node = node->next.get()) {
      length++;
    }
    return length;
  }

  size_t get_capacity() const { return capacity; }
  size_t get_count() const { return count; }
  bool empty() const { return count == 0; }
  double load_factor() const { return (double)count / capacity; }
  double max_load_factor() const { return load_factor_threshold; }
};

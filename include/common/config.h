#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Smallest accepted load factor threshold, below it the table would need an
// unrepresentable number of buckets for any sizeable key count
constexpr double MIN_LOAD_FACTOR = 1e-3;

// Hash functions the benchmark can plug into the table
const std::vector<std::string> &known_hash_functions();
bool is_known_hash_function(const std::string &name);

// store all of our benchmark configuration parameters
struct config_t {

  // Number of buckets the table starts with
  size_t initial_capacity;

  // Maximum count / capacity before the table grows
  double load_factor;

  // Name of the hash function, one of known_hash_functions()
  std::string hash_function;

  // The number of distinct keys inserted per round
  int num_keys;

  // The number of rounds
  int iters;

  // Seed for seeded hash functions and the key shuffle
  uint32_t seed;

  // simple constructor
  config_t() : initial_capacity(7), load_factor(0.75), hash_function("xxhash64"),
               num_keys(100000), iters(5), seed(2400) { }

  // Print the values of all fields
  void dump() const;
};

// Parses a non-negative decimal integer. Throws std::runtime_error on a sign,
// trailing characters, or a value that does not fit.
uint64_t parse_unsigned(const std::string &text);

// Throws std::runtime_error naming the first field that is out of range
void validate_config(const config_t &cfg);

// format of the property file:
// name value
config_t load_config(const std::string &filename);

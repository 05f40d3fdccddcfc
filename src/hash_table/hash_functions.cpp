#include "hash_table/hash_functions.h"

#include <random>
#include <stdexcept>

#include <MurmurHash3.h>
#include <xxHash64.h>

uint64_t division_hash(const void *data, size_t len) {
  const unsigned char *bytes = static_cast<const unsigned char *>(data);
  uint64_t hash = 0;
  for (size_t i = 0; i < len; ++i) {
    hash = hash * 31 + bytes[i];
  }
  return hash;
}

uint64_t polynomial_hash(const void *data, size_t len, uint64_t base, uint64_t mod) {
  if (mod == 0) {
    throw std::invalid_argument("polynomial_hash: modulus must be positive");
  }

  const unsigned char *bytes = static_cast<const unsigned char *>(data);
  // operands stay below mod, products are taken in 128 bits
  unsigned __int128 hash = 0;
  unsigned __int128 power = 1;
  for (size_t i = 0; i < len; ++i) {
    hash = (hash + bytes[i] * power) % mod;
    power = (power * base) % mod;
  }
  return static_cast<uint64_t>(hash);
}

uint64_t djb2_hash(const void *data, size_t len) {
  const unsigned char *bytes = static_cast<const unsigned char *>(data);
  uint32_t hash = 5381;
  for (size_t i = 0; i < len; ++i) {
    hash = ((hash << 5) + hash) + bytes[i]; // hash * 33 + c
  }
  return hash;
}

uint64_t fnv1a_hash(const void *data, size_t len) {
  constexpr uint32_t FNV_OFFSET_BASIS = 2166136261u;
  constexpr uint32_t FNV_PRIME = 16777619u;

  const unsigned char *bytes = static_cast<const unsigned char *>(data);
  uint32_t hash = FNV_OFFSET_BASIS;
  for (size_t i = 0; i < len; ++i) {
    hash ^= bytes[i];
    hash *= FNV_PRIME;
  }
  return hash;
}

uint64_t murmur3_hash(const void *data, size_t len, uint32_t seed) {
  uint64_t hash_output[2] = {0}; // 128 bit output buffer
  MurmurHash3_x86_128(data, (int)len, seed, hash_output);
  return hash_output[0];
}

uint64_t xxhash64_hash(const void *data, size_t len, uint64_t seed) {
  return XXHash64::hash(data, len, seed);
}

uint64_t multiplicative_hash(uint64_t key) {
  uint64_t product = key * 0x9E3779B97F4A7C15ULL; // 2^64 / golden ratio
  return product ^ (product >> 32);
}

// -----------------------------Universal hashing----------------------------------
UniversalHashFamily::UniversalHashFamily(uint32_t seed) {
  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<uint64_t> a_dist(1, PRIME - 1);
  std::uniform_int_distribution<uint64_t> b_dist(0, PRIME - 1);
  a = a_dist(rng);
  b = b_dist(rng);
}

UniversalHashFamily::UniversalHashFamily(uint64_t a, uint64_t b) : a(a), b(b) {
  if (a == 0 || a >= PRIME || b >= PRIME) {
    throw std::invalid_argument("UniversalHashFamily: need 1 <= a < p and 0 <= b < p");
  }
}

uint64_t UniversalHashFamily::apply(uint64_t key) const {
  // a, b and key % PRIME are all below 2^31, so nothing overflows
  return (a * (key % PRIME) + b) % PRIME;
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

// Raw byte hashes. The table maps a raw hash to a bucket with `hash % capacity`.
uint64_t division_hash(const void *data, size_t len);
uint64_t polynomial_hash(const void *data, size_t len, uint64_t base = 31, uint64_t mod = 1000000007ULL);
uint64_t djb2_hash(const void *data, size_t len);
uint64_t fnv1a_hash(const void *data, size_t len);
uint64_t murmur3_hash(const void *data, size_t len, uint32_t seed);
uint64_t xxhash64_hash(const void *data, size_t len, uint64_t seed);

// Knuth multiplicative hashing with the golden ratio constant
uint64_t multiplicative_hash(uint64_t key);

// Bytes a key is hashed over: the characters of a string, the object
// representation of anything else. Equal keys must have equal bytes, so
// padded structs and other non-unique representations are rejected.
struct KeyBytes {
  const void *data;
  size_t len;
};

template <typename K>
inline KeyBytes key_bytes(const K& key) {
  if constexpr (std::is_same_v<K, std::string>) {
    // hash the characters not the object
    return {key.data(), key.length()};
  } else {
    static_assert(std::is_trivially_copyable_v<K> && std::has_unique_object_representations_v<K>,
                  "key must be a string or have a unique object representation");
    return {&key, sizeof(K)};
  }
}

// Runs a byte hash over the key. float and double are hashed over a canonical
// copy with -0.0 folded into 0.0, the two compare equal.
template <typename K, typename ByteHash>
inline uint64_t hash_key_bytes(const K& key, ByteHash byte_hash) {
  if constexpr (std::is_same_v<K, float> || std::is_same_v<K, double>) {
    K canonical = (key == K(0)) ? K(0) : key;
    return byte_hash(&canonical, sizeof(K));
  } else {
    KeyBytes bytes = key_bytes(key);
    return byte_hash(bytes.data, bytes.len);
  }
}

template <typename K>
struct DivisionHasher {
  uint64_t operator()(const K& key) const {
    return hash_key_bytes(key, division_hash);
  }
};

template <typename K>
struct PolynomialHasher {
  uint64_t base = 31;
  uint64_t mod = 1000000007ULL;

  uint64_t operator()(const K& key) const {
    return hash_key_bytes(key, [this](const void *data, size_t len) {
      return polynomial_hash(data, len, base, mod);
    });
  }
};

template <typename K>
struct Djb2Hasher {
  uint64_t operator()(const K& key) const {
    return hash_key_bytes(key, djb2_hash);
  }
};

template <typename K>
struct Fnv1aHasher {
  uint64_t operator()(const K& key) const {
    return hash_key_bytes(key, fnv1a_hash);
  }
};

template <typename K>
struct MurmurHash3Hasher {
  uint32_t seed = 2400;

  uint64_t operator()(const K& key) const {
    return hash_key_bytes(key, [this](const void *data, size_t len) {
      return murmur3_hash(data, len, seed);
    });
  }
};

template <typename K>
struct XXHash64Hasher {
  uint64_t seed = 0;

  uint64_t operator()(const K& key) const {
    return hash_key_bytes(key, [this](const void *data, size_t len) {
      return xxhash64_hash(data, len, seed);
    });
  }
};

template <typename K>
struct MultiplicativeHasher {
  static_assert(std::is_integral_v<K>, "multiplicative hashing needs an integral key");

  uint64_t operator()(const K& key) const {
    return multiplicative_hash(static_cast<uint64_t>(key));
  }
};

// One member of the universal family ((a * k + b) mod p), p = 2^31 - 1.
// Strings are folded to an integer with the polynomial hash first.
class UniversalHashFamily {
public:
  static constexpr uint64_t PRIME = 2147483647ULL;

  explicit UniversalHashFamily(uint32_t seed);
  UniversalHashFamily(uint64_t a, uint64_t b);

  uint64_t apply(uint64_t key) const;
  uint64_t get_a() const { return a; }
  uint64_t get_b() const { return b; }

private:
  uint64_t a; // 1 <= a < PRIME
  uint64_t b; // 0 <= b < PRIME
};

template <typename K>
struct UniversalHasher {
  UniversalHashFamily family;

  explicit UniversalHasher(uint32_t seed = 2400) : family(seed) {}
  UniversalHasher(uint64_t a, uint64_t b) : family(a, b) {}

  uint64_t operator()(const K& key) const {
    if constexpr (std::is_integral_v<K>) {
      return family.apply(static_cast<uint64_t>(key));
    } else {
      return family.apply(hash_key_bytes(key, [](const void *data, size_t len) {
        return polynomial_hash(data, len, 31, UniversalHashFamily::PRIME);
      }));
    }
  }
};

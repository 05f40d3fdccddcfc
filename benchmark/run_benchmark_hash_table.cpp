#include "hash_table/chained_hash_table.h"
#include "hash_table/bucket_stats.h"
#include "common/config.h"
#include "common/utils.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

struct RoundResult {
  uint64_t insert_ns = 0;
  uint64_t search_ns = 0;
  uint64_t remove_ns = 0;
  size_t found = 0;
};

template <typename Table>
RoundResult do_round(Table &ht, const std::vector<std::string> &keys, std::mt19937 &rng) {
  RoundResult res;

  auto start = std::chrono::high_resolution_clock::now();
  for (size_t i = 0; i < keys.size(); ++i) {
    ht.insert(keys[i], (int)i);
  }
  // second pass is all updates, the capacity must not move
  for (size_t i = 0; i < keys.size(); ++i) {
    ht.insert(keys[i], (int)i + 1);
  }
  auto end = std::chrono::high_resolution_clock::now();
  res.insert_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

  std::vector<std::string> lookups(keys);
  std::shuffle(lookups.begin(), lookups.end(), rng);

  start = std::chrono::high_resolution_clock::now();
  for (const std::string &key : lookups) {
    if (ht.search(key).has_value())
      res.found++;
  }
  end = std::chrono::high_resolution_clock::now();
  res.search_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

  start = std::chrono::high_resolution_clock::now();
  for (size_t i = 0; i < lookups.size(); i += 2) {
    ht.remove(lookups[i]);
  }
  end = std::chrono::high_resolution_clock::now();
  res.remove_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

  return res;
}

static double mops(size_t ops, uint64_t ns) {
  if (ns == 0)
    return 0.0;
  return (double)ops / ((double)ns / 1e9) / 1e6;
}

template <typename Hash>
void run_benchmark(const config_t &cfg, const Hash &hash) {
  std::vector<std::string> keys;
  keys.reserve(cfg.num_keys);
  for (int i = 0; i < cfg.num_keys; ++i) {
    keys.push_back("key" + std::to_string(i));
  }

  std::mt19937 rng(cfg.seed);

  for (int iter = 0; iter < cfg.iters; ++iter) {
    ChainedHashTable<std::string, int, Hash> ht(cfg.initial_capacity, cfg.load_factor, hash);
    RoundResult res = do_round(ht, keys, rng);

    if (res.found != keys.size()) {
      log_error("Round " + std::to_string(iter) + ": found " + std::to_string(res.found) +
                " of " + std::to_string(keys.size()) + " keys");
    }

    std::cout << std::fixed << std::setprecision(2)
              << "[Round " << iter << "] insert " << mops(2 * keys.size(), res.insert_ns) << " Mops/s"
              << ", search " << mops(keys.size(), res.search_ns) << " Mops/s"
              << ", remove " << mops((keys.size() + 1) / 2, res.remove_ns) << " Mops/s"
              << ", capacity " << ht.get_capacity()
              << ", load factor " << std::setprecision(3) << ht.load_factor() << std::endl;

    if (iter == cfg.iters - 1) {
      std::cout << "Bucket distribution after removals: ";
      analyze_buckets(ht).dump(std::cout);
    }
  }
}

void dispatch(const config_t &cfg) {
  const std::string &name = cfg.hash_function;
  if (name == "division") {
    run_benchmark(cfg, DivisionHasher<std::string>());
  } else if (name == "polynomial") {
    run_benchmark(cfg, PolynomialHasher<std::string>());
  } else if (name == "djb2") {
    run_benchmark(cfg, Djb2Hasher<std::string>());
  } else if (name == "fnv1a") {
    run_benchmark(cfg, Fnv1aHasher<std::string>());
  } else if (name == "murmur3") {
    run_benchmark(cfg, MurmurHash3Hasher<std::string>{cfg.seed});
  } else if (name == "xxhash64") {
    run_benchmark(cfg, XXHash64Hasher<std::string>{cfg.seed});
  } else if (name == "std") {
    run_benchmark(cfg, std::hash<std::string>());
  } else if (name == "universal") {
    run_benchmark(cfg, UniversalHasher<std::string>(cfg.seed));
  } else {
    throw std::runtime_error("Unknown hash function: " + name);
  }
}

int main(int argc, char** argv) {
  // 1. Argument Parsing
  if (argc != 2 && (argc < 3 || argc > 5)) {
    std::cerr << "Usage: " << argv[0] << " <config_file>\n"
              << "       " << argv[0] << " <num_keys> <hash_function> [initial_capacity] [load_factor]\n";
    return 1;
  }

  try {
    config_t cfg;
    if (argc == 2) {
      cfg = load_config(argv[1]);
    } else {
      cfg.num_keys = std::stoi(argv[1]);
      cfg.hash_function = argv[2];
      if (argc > 3)
        cfg.initial_capacity = parse_unsigned(argv[3]);
      if (argc > 4)
        cfg.load_factor = std::stod(argv[4]);
    }

    if (!is_known_hash_function(cfg.hash_function)) {
      std::string names;
      for (const std::string &known : known_hash_functions())
        names += " " + known;
      throw std::runtime_error("Unknown hash function '" + cfg.hash_function + "', expected one of:" + names);
    }
    validate_config(cfg);

    cfg.dump();
    dispatch(cfg);
  } catch (const std::exception &e) {
    log_error(e.what());
    return 1;
  }

  log_info("Benchmark complete.");
  return 0;
}

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "common/config.h"

void log(const std::string& message) {
  std::cout << "[TEST] " << message << std::endl;
}

// Writes contents to a fresh file under /tmp and returns its path
std::string write_temp_config(const std::string& contents) {
  char path[] = "/tmp/hash_table_config_XXXXXX";
  int fd = mkstemp(path);
  if (fd < 0)
    throw std::runtime_error("mkstemp failed");
  close(fd);

  std::ofstream out(path);
  out << contents;
  return path;
}

bool load_throws(const std::string& contents) {
  std::string path = write_temp_config(contents);
  bool threw = false;
  try {
    load_config(path);
  } catch (const std::runtime_error& e) {
    log(std::string("expected failure: ") + e.what());
    threw = true;
  }
  std::remove(path.c_str());
  return threw;
}

void test_defaults() {
  log("Running Defaults Test...");
  config_t cfg;
  assert(cfg.initial_capacity == 7);
  assert(cfg.load_factor == 0.75);
  assert(cfg.hash_function == "xxhash64");
  assert(cfg.num_keys == 100000);
  assert(cfg.iters == 5);
  assert(cfg.seed == 2400);
  log("Defaults Test Passed!");
}

void test_load_full_config() {
  log("Running Load Config Test...");
  std::string path = write_temp_config(
    "# benchmark properties\n"
    "\n"
    "initial_capacity 16\n"
    "load_factor 0.5\n"
    "hash_function murmur3   # seeded\n"
    "num_keys 2500\n"
    "iters 3\n"
    "seed 7\n");

  config_t cfg = load_config(path);
  std::remove(path.c_str());

  assert(cfg.initial_capacity == 16);
  assert(cfg.load_factor == 0.5);
  assert(cfg.hash_function == "murmur3");
  assert(cfg.num_keys == 2500);
  assert(cfg.iters == 3);
  assert(cfg.seed == 7);
  cfg.dump();

  log("Load Config Test Passed!");
}

void test_partial_config_keeps_defaults() {
  log("Running Partial Config Test...");
  std::string path = write_temp_config("hash_function fnv1a\n");
  config_t cfg = load_config(path);
  std::remove(path.c_str());

  assert(cfg.hash_function == "fnv1a");
  assert(cfg.initial_capacity == 7);
  assert(cfg.load_factor == 0.75);
  log("Partial Config Test Passed!");
}

void test_bad_configs() {
  log("Running Bad Config Test...");
  assert(load_throws("initial_capacity\n"));
  assert(load_throws("initial_capacity 0\n"));
  assert(load_throws("load_factor -0.5\n"));
  assert(load_throws("load_factor abc\n"));
  assert(load_throws("hash_function sha256\n"));
  assert(load_throws("iters 0\n"));
  assert(load_throws("num_keys 10 20\n"));
  assert(load_throws("bucket_count 10\n"));
  assert(load_throws("initial_capacity -5\n"));
  assert(load_throws("initial_capacity 12abc\n"));
  assert(load_throws("seed -1\n"));
  assert(load_throws("seed 4294967296\n"));
  assert(load_throws("load_factor 1e-30\n"));
  assert(load_throws("load_factor inf\n"));
  assert(load_throws("num_keys -10\n"));

  bool threw = false;
  try {
    load_config("/nonexistent/hash_table.conf");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  log("Bad Config Test Passed!");
}

void test_known_hash_functions() {
  log("Running Known Hash Functions Test...");
  assert(is_known_hash_function("xxhash64"));
  assert(is_known_hash_function("murmur3"));
  assert(is_known_hash_function("universal"));
  assert(!is_known_hash_function("md5"));
  assert(known_hash_functions().size() == 8);
  log("Known Hash Functions Test Passed!");
}

bool validate_throws(const config_t& cfg) {
  try {
    validate_config(cfg);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void test_parse_unsigned() {
  log("Running Parse Unsigned Test...");
  assert(parse_unsigned("0") == 0);
  assert(parse_unsigned("4096") == 4096);
  assert(parse_unsigned("18446744073709551615") == 18446744073709551615ULL);

  const char *bad[] = {"-5", "+5", "", " 5", "5x", "abc", "18446744073709551616"};
  for (const char *text : bad) {
    bool threw = false;
    try {
      parse_unsigned(text);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }
  log("Parse Unsigned Test Passed!");
}

void test_validate_config() {
  log("Running Validate Config Test...");
  config_t cfg;
  assert(!validate_throws(cfg));

  config_t negative_keys;
  negative_keys.num_keys = -1;
  assert(validate_throws(negative_keys));

  config_t tiny_load;
  tiny_load.load_factor = 1e-30;
  assert(validate_throws(tiny_load));

  config_t smallest_load;
  smallest_load.load_factor = MIN_LOAD_FACTOR;
  assert(!validate_throws(smallest_load));

  config_t zero_capacity;
  zero_capacity.initial_capacity = 0;
  assert(validate_throws(zero_capacity));

  config_t unknown_hash;
  unknown_hash.hash_function = "md5";
  assert(validate_throws(unknown_hash));

  config_t no_iters;
  no_iters.iters = 0;
  assert(validate_throws(no_iters));

  log("Validate Config Test Passed!");
}

int main() {
  test_defaults();
  test_load_full_config();
  test_partial_config_keeps_defaults();
  test_bad_configs();
  test_known_hash_functions();
  test_parse_unsigned();
  test_validate_config();

  log("All Config Tests Passed!");
  return 0;
}

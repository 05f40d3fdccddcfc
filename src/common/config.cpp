#include "common/config.h"
#include "common/utils.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

const std::vector<std::string> &known_hash_functions() {
  static const std::vector<std::string> names = {
    "division", "polynomial", "djb2", "fnv1a", "murmur3", "xxhash64", "std", "universal"
  };
  return names;
}

bool is_known_hash_function(const std::string &name) {
  for (const std::string &known : known_hash_functions()) {
    if (known == name)
      return true;
  }
  return false;
}

uint64_t parse_unsigned(const std::string &text) {
  // std::stoull accepts a leading '-' and wraps the value
  if (text.empty() || !std::isdigit((unsigned char)text[0])) {
    throw std::runtime_error("Expected a non-negative integer, got '" + text + "'");
  }

  size_t parsed = 0;
  unsigned long long value = 0;
  try {
    value = std::stoull(text, &parsed);
  } catch (const std::out_of_range &) {
    throw std::runtime_error("Integer out of range: '" + text + "'");
  }
  if (parsed != text.size()) {
    throw std::runtime_error("Expected a non-negative integer, got '" + text + "'");
  }
  return value;
}

void validate_config(const config_t &cfg) {
  if (cfg.initial_capacity == 0)
    throw std::runtime_error("initial_capacity must be positive");
  if (!std::isfinite(cfg.load_factor) || cfg.load_factor < MIN_LOAD_FACTOR)
    throw std::runtime_error("load_factor must be at least " + std::to_string(MIN_LOAD_FACTOR));
  if (!is_known_hash_function(cfg.hash_function))
    throw std::runtime_error("Unknown hash function '" + cfg.hash_function + "'");
  if (cfg.num_keys < 0)
    throw std::runtime_error("num_keys must not be negative");
  if (cfg.iters <= 0)
    throw std::runtime_error("iters must be positive");
}

void config_t::dump() const {
  std::cout << "Configuration:\n"
            << "  initial_capacity: " << initial_capacity << "\n"
            << "  load_factor:      " << load_factor << "\n"
            << "  hash_function:    " << hash_function << "\n"
            << "  num_keys:         " << num_keys << "\n"
            << "  iters:            " << iters << "\n"
            << "  seed:             " << seed << std::endl;
}

config_t load_config(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    int err = errno;
    log_error(("Could not open " + filename).c_str(), err);
    throw std::runtime_error("Could not open config file: " + filename);
  }

  config_t cfg;
  std::string line;
  int line_num = 0;
  while (std::getline(file, line)) {
    line_num++;

    std::stringstream ss(line);
    std::string name;
    std::string token;
    if (!(ss >> name) || name[0] == '#')
      continue;

    bool ok = false;
    if (name == "initial_capacity") {
      ok = static_cast<bool>(ss >> token);
      if (ok) {
        cfg.initial_capacity = parse_unsigned(token);
        ok = cfg.initial_capacity > 0;
      }
    } else if (name == "load_factor") {
      ok = static_cast<bool>(ss >> cfg.load_factor) && std::isfinite(cfg.load_factor) &&
           cfg.load_factor >= MIN_LOAD_FACTOR;
    } else if (name == "hash_function") {
      ok = static_cast<bool>(ss >> cfg.hash_function);
      if (ok && !is_known_hash_function(cfg.hash_function)) {
        throw std::runtime_error("Unknown hash function '" + cfg.hash_function +
                                 "' on line " + std::to_string(line_num));
      }
    } else if (name == "num_keys") {
      ok = static_cast<bool>(ss >> cfg.num_keys) && cfg.num_keys >= 0;
    } else if (name == "iters") {
      ok = static_cast<bool>(ss >> cfg.iters) && cfg.iters > 0;
    } else if (name == "seed") {
      ok = static_cast<bool>(ss >> token);
      if (ok) {
        uint64_t seed = parse_unsigned(token);
        ok = seed <= 0xFFFFFFFFULL;
        cfg.seed = static_cast<uint32_t>(seed);
      }
    } else {
      throw std::runtime_error("Unknown property '" + name + "' on line " + std::to_string(line_num));
    }

    std::string trailing;
    if (!ok || (ss >> trailing && trailing[0] != '#')) {
      throw std::runtime_error("Malformed config on line " + std::to_string(line_num));
    }
  }

  return cfg;
}

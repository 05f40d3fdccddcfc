#include <iostream>
#include <cstring>

#include "common/utils.h"

void log_info(const std::string &message) {
  std::cout << "[Info] " << message << std::endl;
}

void log_error(const char *prefix, int err) {
  char buf[1024];
  std::cerr << "[Error] " << prefix << " " 
            << strerror_r(err, buf, sizeof(buf))
            << std::endl;
}

void log_error(const std::string &message) {
  std::cerr << "[Error] " << message << std::endl;
}

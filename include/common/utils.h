#pragma once

#include <string>

void log_info(const std::string &message);
void log_error(const char *prefix, int err);
void log_error(const std::string &message);

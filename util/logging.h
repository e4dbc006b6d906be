#ifndef UTIL_LOGGING_H_
#define UTIL_LOGGING_H_

#include <string>

#include "absl/status/status.h"

// Installs the default spdlog logger. Everything is written to stderr, and
// additionally to 'log_file' when it's non-empty. 'level' takes spdlog's level
// names: trace, debug, info, warning, error, critical, off.
absl::Status init_logging(const std::string& level,
                          const std::string& log_file = "");

#endif

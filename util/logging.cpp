#include "util/logging.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace {
const char* kPattern = "[%H:%M:%S.%e] [%^%l%$] %v";
}  // namespace

absl::Status init_logging(const std::string& level,
                          const std::string& log_file) {
  spdlog::level::level_enum lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") {
    return absl::InvalidArgumentError("Unknown log level: " + level);
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file, /*truncate=*/true));
    } catch (const spdlog::spdlog_ex& e) {
      return absl::FailedPreconditionError("Could not open log file '" +
                                           log_file + "': " + e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("skirmish", sinks.begin(),
                                                 sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(lvl);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return absl::OkStatus();
}

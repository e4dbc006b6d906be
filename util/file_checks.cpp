#include "util/file_checks.h"

#include <system_error>

absl::StatusOr<bool> path_exists(const std::filesystem::path& path) {
  std::error_code ec;
  bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    return absl::FailedPreconditionError("Could not check '" + path.string() +
                                         "': " + ec.message());
  }
  return exists;
}

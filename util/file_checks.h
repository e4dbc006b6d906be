#ifndef UTIL_FILE_CHECKS_H_
#define UTIL_FILE_CHECKS_H_

#include <filesystem>

#include "absl/status/statusor.h"

// Returns whether 'path' exists. Returns FAILED_PRECONDITION naming 'path'
// when it can't be checked, e.g. a component isn't searchable or the name is
// too long.
absl::StatusOr<bool> path_exists(const std::filesystem::path& path);

#endif

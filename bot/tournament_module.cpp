#include "bot/tournament_module.h"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <fstream>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "util/file_checks.h"
#include "util/status_macros.h"

namespace bot {

absl::StatusOr<std::vector<TournamentModuleVersion>> load_tournament_modules(
    const std::filesystem::path& file) {
  std::ifstream in(file);
  if (!in) {
    return absl::FailedPreconditionError(
        "Could not read the tournament module table '" + file.string() + "'");
  }
  std::vector<TournamentModuleVersion> table;
  std::string line;
  for (int line_num = 1; std::getline(in, line); ++line_num) {
    absl::string_view stripped = absl::StripAsciiWhitespace(line);
    if (stripped.empty() || stripped[0] == '#') continue;

    std::vector<std::string> fields =
        absl::StrSplit(stripped, absl::ByAnyChar(" \t"), absl::SkipEmpty());
    TournamentModuleVersion version;
    if (fields.size() != 3 ||
        !absl::SimpleHexAtoi(fields[0], &version.bwapi_crc32)) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "%s:%d: expected '<crc32> <bwapi version> <module file>'",
          file.string(), line_num));
    }
    version.bwapi_version = fields[1];
    version.module_file = fields[2];
    table.push_back(std::move(version));
  }
  return table;
}

absl::StatusOr<uint32_t> file_crc32(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return absl::FailedPreconditionError("Could not read '" + path.string() +
                                         "'");
  }
  uLong crc = crc32(0L, Z_NULL, 0);
  char buf[1 << 16];
  while (in) {
    in.read(buf, sizeof(buf));
    std::streamsize n = in.gcount();
    if (n <= 0) break;
    crc = crc32(crc, reinterpret_cast<const Bytef*>(buf),
                static_cast<uInt>(n));
  }
  if (in.bad()) {
    return absl::InternalError("Error while reading '" + path.string() + "'");
  }
  return static_cast<uint32_t>(crc);
}

std::optional<TournamentModuleVersion> find_tournament_module(
    uint32_t bwapi_crc32, const std::vector<TournamentModuleVersion>& table) {
  for (const TournamentModuleVersion& version : table) {
    if (version.bwapi_crc32 == bwapi_crc32) return version;
  }
  return std::nullopt;
}

absl::StatusOr<std::optional<std::filesystem::path>> resolve_tournament_module(
    const std::filesystem::path& bwapi_dll, const std::filesystem::path& tm_dir,
    const std::vector<TournamentModuleVersion>& table) {
  ASSIGN_OR_RETURN(bool dll_found, path_exists(bwapi_dll));
  if (!dll_found) {
    return absl::FailedPreconditionError("Could not find '" +
                                         bwapi_dll.string() + "'");
  }
  ASSIGN_OR_RETURN(uint32_t crc, file_crc32(bwapi_dll));

  std::optional<TournamentModuleVersion> version =
      find_tournament_module(crc, table);
  if (!version) {
    spdlog::warn(
        "Unknown BWAPI build '{}' (crc32 {}), running without a tournament "
        "module",
        bwapi_dll.string(), absl::StrFormat("%08x", crc));
    return std::optional<std::filesystem::path>();
  }

  std::filesystem::path module = tm_dir / version->module_file;
  ASSIGN_OR_RETURN(bool module_found, path_exists(module));
  if (!module_found) {
    return absl::FailedPreconditionError(
        "Could not find tournament module for BWAPI " + version->bwapi_version +
        " at '" + module.string() + "'");
  }
  spdlog::debug("Using tournament module '{}' for BWAPI {}", module.string(),
                version->bwapi_version);
  return std::optional<std::filesystem::path>(module);
}

}  // namespace bot

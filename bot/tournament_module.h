// Tournament modules are BWAPI add-ons that enforce tournament rules and
// write match telemetry. Each one only works with the BWAPI release it was
// built against, which we identify by the CRC-32 of the bot's BWAPI.dll.

#ifndef BOT_TOURNAMENT_MODULE_H_
#define BOT_TOURNAMENT_MODULE_H_

#include <stdint.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace bot {

struct TournamentModuleVersion {
  uint32_t bwapi_crc32;
  std::string bwapi_version;
  // File name under the tools' tm/ folder.
  std::string module_file;
};

// Name of the version table in the tournament module folder.
inline constexpr char kTournamentModuleTable[] = "versions.txt";

// Reads a version table. Each line holds the CRC-32 of a BWAPI.dll in hex,
// its BWAPI version and the module file, separated by whitespace. Blank lines
// and lines starting with '#' are skipped.
absl::StatusOr<std::vector<TournamentModuleVersion>> load_tournament_modules(
    const std::filesystem::path& file);

// CRC-32 (zlib polynomial) of the file's contents.
absl::StatusOr<uint32_t> file_crc32(const std::filesystem::path& path);

std::optional<TournamentModuleVersion> find_tournament_module(
    uint32_t bwapi_crc32, const std::vector<TournamentModuleVersion>& table);

// Picks the tournament module in 'tm_dir' matching 'bwapi_dll'. Returns
// nullopt, with a warning, for BWAPI builds missing from 'table'. Returns
// FAILED_PRECONDITION if 'bwapi_dll' or the matching module file is missing.
absl::StatusOr<std::optional<std::filesystem::path>> resolve_tournament_module(
    const std::filesystem::path& bwapi_dll, const std::filesystem::path& tm_dir,
    const std::vector<TournamentModuleVersion>& table);

}  // namespace bot

#endif

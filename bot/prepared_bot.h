#ifndef BOT_PREPARED_BOT_H_
#define BOT_PREPARED_BOT_H_

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "bot/binary.h"
#include "bot/race.h"
#include "bot/tournament_module.h"

namespace bot {

// What a bot ships with, independent of any match.
struct BotDefinition {
  Race race = Race::RANDOM;
  // Overrides searching bwapi-data/AI for the bot's binary. Relative paths
  // are relative to the bot's folder.
  std::optional<std::string> executable;
};

// How a bot takes part in one match.
struct BotConfig {
  // Name of the bot's folder.
  std::string name;
  // In-game name. Defaults to 'name'.
  std::optional<std::string> player_name;
  // Overrides the bot's default race.
  std::optional<Race> race;
  // Runs the bot in a visible game window through injection instead of
  // headless.
  bool headful = false;
};

struct PrepareOptions {
  bool tournament_module = false;
  // Folder holding the tournament module DLLs.
  std::filesystem::path tm_dir;
  // Only read when 'tournament_module' is set.
  std::vector<TournamentModuleVersion> tm_table;
};

// A bot ready to be launched into a match.
struct PreparedBot {
  Binary binary;
  Race race = Race::RANDOM;
  std::string name;
  // The bot's folder. Its processes run here.
  std::filesystem::path working_dir;
  std::filesystem::path log_dir;
  bool headful = false;
  std::optional<std::filesystem::path> tournament_module;

  std::filesystem::path bwapi_data() const {
    return working_dir / "bwapi-data";
  }
  std::filesystem::path bwapi_dll() const { return bwapi_data() / "BWAPI.dll"; }

  // Resolves the bot's binary and race, picks its tournament module, and
  // creates its bwapi-data/read, bwapi-data/write and logs folders.
  static absl::StatusOr<PreparedBot> prepare(const BotConfig& config,
                                             const std::filesystem::path& dir,
                                             const BotDefinition& definition,
                                             const PrepareOptions& options);
};

}  // namespace bot

#endif

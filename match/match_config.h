#ifndef MATCH_MATCH_CONFIG_H_
#define MATCH_MATCH_CONFIG_H_

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "bot/prepared_bot.h"
#include "game_table/game_table.h"
#include "launch/execution_wrapper.h"
#include "match/poll.h"

namespace match {

// BWAPI's game table has room for this many games.
inline constexpr size_t kMaxBots = game_table::kSlotCount;

// SNP_DirectIP.snp builds smaller than this only support about 6 players.
inline constexpr uintmax_t kDirectIpSnpSize = 46100;

struct GameConfig {
  // Relative to the StarCraft folder unless absolute. Unused when a human
  // hosts.
  std::string map;
  std::string game_name = "skirmish";
  // A human creates the game and every bot joins it.
  bool human_host = false;
  bool human_speed = false;
  std::optional<int> latency_frames;
  bool tournament_module = false;
  std::optional<int> timeout_at_frame;
  PollBudget poll_budget;
  std::chrono::milliseconds supervise_interval{1000};
};

// Where the game, the launcher tools and the bots are installed.
struct Installation {
  std::filesystem::path starcraft_exe;
  std::filesystem::path tools_dir;
  std::filesystem::path bots_dir;
  std::string java_path = "java";
  launch::ExecutionWrapper wrapper = launch::ExecutionWrapper::None();

  std::filesystem::path starcraft_dir() const {
    return starcraft_exe.parent_path();
  }
  std::filesystem::path tm_dir() const { return tools_dir / "tm"; }
};

// One bot taking part in a match.
struct BotEntry {
  bot::BotConfig config;
  bot::BotDefinition definition;
};

// Parses "name[:race[:executable]]". The race overrides the bot's default
// race for this match. An empty race or executable keeps the bot's default.
// Returns INVALID_ARGUMENT for a missing name or unknown race.
absl::StatusOr<BotEntry> parse_bot_entry(const std::string& str);

// Applies "name:race" entries from 'races' as the default race of the named
// bots and "name:player" entries from 'player_names' as their in-game names.
// A race given in the bot entry itself still overrides the default. Returns
// INVALID_ARGUMENT for a malformed entry, an unknown race or a name that
// isn't among 'bots'.
absl::Status apply_bot_defaults(const std::vector<std::string>& races,
                                const std::vector<std::string>& player_names,
                                std::vector<BotEntry>* bots);

// Checks that 'bots' makes a playable match on 'game'. Returns
// INVALID_ARGUMENT if there are no bots or more than kMaxBots, if no map is
// set and no human hosts, if the map doesn't exist, or if a poll budget or
// interval can't be used.
absl::Status validate_game_config(const GameConfig& game,
                                  const Installation& installation,
                                  const std::vector<BotEntry>& bots);

// Logs a warning for each setup problem that won't stop the match but may
// break it: bots added more than once, games left over in the game table and
// a missing or outdated SNP_DirectIP.snp.
void warn_about_setup(const Installation& installation,
                      const std::vector<BotEntry>& bots,
                      const game_table::GameTable* table);

}  // namespace match

#endif

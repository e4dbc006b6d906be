#include "match/match_config.h"

#include <spdlog/spdlog.h>

#include <set>
#include <utility>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "util/status_macros.h"

namespace match {

namespace {

// Splits "name:value" entries of 'what'.
absl::StatusOr<std::pair<std::string, std::string>> split_named_value(
    const std::string& str, const std::string& what) {
  std::vector<std::string> parts = absl::StrSplit(str, absl::MaxSplits(':', 1));
  if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Expected '<bot>:<", what, ">', got '", str, "'"));
  }
  return std::make_pair(parts[0], parts[1]);
}

// Every entry of 'bots' named 'name'. A bot may play more than once.
absl::StatusOr<std::vector<BotEntry*>> find_bots(const std::string& name,
                                                 const std::string& what,
                                                 std::vector<BotEntry>* bots) {
  std::vector<BotEntry*> found;
  for (BotEntry& entry : *bots) {
    if (entry.config.name == name) found.push_back(&entry);
  }
  if (found.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("A ", what, " is set for '", name,
                     "', which isn't one of the bots"));
  }
  return found;
}

}  // namespace

absl::StatusOr<BotEntry> parse_bot_entry(const std::string& str) {
  std::vector<std::string> parts = absl::StrSplit(str, absl::MaxSplits(':', 2));
  BotEntry entry;
  entry.config.name = parts[0];
  if (entry.config.name.empty()) {
    return absl::InvalidArgumentError("Bot entry '" + str + "' has no name");
  }
  if (parts.size() > 1 && !parts[1].empty()) {
    ASSIGN_OR_RETURN(entry.config.race, bot::parse_race(parts[1]));
  }
  if (parts.size() > 2 && !parts[2].empty()) {
    entry.definition.executable = parts[2];
  }
  return entry;
}

absl::Status apply_bot_defaults(const std::vector<std::string>& races,
                                const std::vector<std::string>& player_names,
                                std::vector<BotEntry>* bots) {
  for (const std::string& str : races) {
    ASSIGN_OR_RETURN(auto named, split_named_value(str, "race"));
    ASSIGN_OR_RETURN(bot::Race race, bot::parse_race(named.second));
    ASSIGN_OR_RETURN(std::vector<BotEntry*> found,
                     find_bots(named.first, "race", bots));
    for (BotEntry* entry : found) entry->definition.race = race;
  }
  for (const std::string& str : player_names) {
    ASSIGN_OR_RETURN(auto named, split_named_value(str, "player name"));
    ASSIGN_OR_RETURN(std::vector<BotEntry*> found,
                     find_bots(named.first, "player name", bots));
    for (BotEntry* entry : found) entry->config.player_name = named.second;
  }
  return absl::OkStatus();
}

absl::Status validate_game_config(const GameConfig& game,
                                  const Installation& installation,
                                  const std::vector<BotEntry>& bots) {
  if (bots.empty()) {
    return absl::InvalidArgumentError("A match needs at least one bot.");
  }
  if (bots.size() > kMaxBots) {
    return absl::InvalidArgumentError(
        "A match can have at most " + std::to_string(kMaxBots) +
        " bots, got " + std::to_string(bots.size()) + ".");
  }
  if (game.poll_budget.attempts <= 0) {
    return absl::InvalidArgumentError(
        "At least one poll attempt is needed, got " +
        std::to_string(game.poll_budget.attempts) + ".");
  }
  if (game.poll_budget.interval.count() < 0) {
    return absl::InvalidArgumentError(
        "The poll interval can't be negative, got " +
        std::to_string(game.poll_budget.interval.count()) + "ms.");
  }
  if (game.supervise_interval.count() <= 0) {
    return absl::InvalidArgumentError(
        "The supervise interval must be positive, got " +
        std::to_string(game.supervise_interval.count()) + "ms.");
  }
  if (game.human_host) return absl::OkStatus();

  if (game.map.empty()) {
    return absl::InvalidArgumentError(
        "A map must be set unless a human hosts the game.");
  }
  std::filesystem::path map = game.map;
  if (map.is_relative()) map = installation.starcraft_dir() / map;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(map, ec)) {
    return absl::InvalidArgumentError("Map not found: '" + map.string() +
                                      "'");
  }
  return absl::OkStatus();
}

void warn_about_setup(const Installation& installation,
                      const std::vector<BotEntry>& bots,
                      const game_table::GameTable* table) {
  std::set<std::string> names;
  for (const BotEntry& entry : bots) {
    if (!names.insert(entry.config.name).second) {
      spdlog::warn(
          "'{}' was added multiple times. All instances share the same "
          "read, write and log folders and headful mode won't work as "
          "expected.",
          entry.config.name);
    }
  }

  if (table) {
    for (const game_table::SlotStatus& slot : table->slots) {
      if (!slot.empty() && slot.connected) {
        spdlog::warn(
            "Process {} is already in the game table and will interfere "
            "with game creation.",
            slot.process_id);
      }
    }
  }

  std::filesystem::path snp = installation.starcraft_dir() / "SNP_DirectIP.snp";
  std::error_code ec;
  uintmax_t size = std::filesystem::file_size(snp, ec);
  if (ec) {
    spdlog::warn(
        "Couldn't find '{}'. Copy the provided SNP_DirectIP.snp there or "
        "install BWAPI.",
        snp.string());
  } else if (size != kDirectIpSnpSize) {
    spdlog::warn(
        "'{}' might not support more than ~6 bots per game. Overwrite it with "
        "the provided SNP_DirectIP.snp to support more.",
        snp.string());
  }
}

}  // namespace match

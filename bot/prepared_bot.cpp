#include "bot/prepared_bot.h"

#include <spdlog/spdlog.h>

#include <system_error>

#include "util/status_macros.h"

namespace bot {
namespace {

absl::Status create_dir(const std::filesystem::path& dir) {
  std::error_code error;
  std::filesystem::create_directories(dir, error);
  if (error) {
    return absl::FailedPreconditionError("Could not create folder '" +
                                         dir.string() +
                                         "': " + error.message());
  }
  return absl::OkStatus();
}

absl::StatusOr<Binary> resolve_binary(const std::filesystem::path& dir,
                                      const BotDefinition& definition) {
  if (definition.executable) {
    std::filesystem::path path = dir / *definition.executable;
    std::optional<Binary> binary = Binary::from_path(path);
    if (!binary) {
      return absl::InvalidArgumentError(
          "Unsupported bot executable '" + path.string() +
          "', expected a .dll, .jar or .exe file");
    }
    return *binary;
  }
  return Binary::search(dir / "bwapi-data" / "AI");
}

}  // namespace

absl::StatusOr<PreparedBot> PreparedBot::prepare(
    const BotConfig& config, const std::filesystem::path& dir,
    const BotDefinition& definition, const PrepareOptions& options) {
  PreparedBot bot;
  bot.working_dir = dir;
  bot.log_dir = dir / "logs";
  bot.name = config.player_name.value_or(config.name);
  bot.headful = config.headful;

  if (config.race && definition.race != Race::RANDOM &&
      *config.race != definition.race) {
    spdlog::warn("Bot '{}' is configured to play as {}, but its default race "
                 "is {}!",
                 config.name, to_string(*config.race),
                 to_string(definition.race));
  }
  bot.race = config.race.value_or(definition.race);

  RETURN_IF_ERROR(create_dir(bot.bwapi_data() / "read"));
  RETURN_IF_ERROR(create_dir(bot.bwapi_data() / "write"));
  RETURN_IF_ERROR(create_dir(bot.log_dir));

  ASSIGN_OR_RETURN(bot.binary, resolve_binary(dir, definition));
  spdlog::debug("Bot '{}' uses {} '{}'", config.name,
                to_string(bot.binary.kind), bot.binary.path.string());

  if (options.tournament_module) {
    ASSIGN_OR_RETURN(bot.tournament_module,
                     resolve_tournament_module(bot.bwapi_dll(), options.tm_dir,
                                               options.tm_table));
  }
  return bot;
}

}  // namespace bot

// Launches a BWAPI bot match and waits for its games to finish.
// clang-format off
// Example usage:
// $ skirmish --map="maps/(2)Destination.scx" --bots=Stardust:p,Purple:z --headful=Stardust
// clang-format on

#include <spdlog/spdlog.h>
#include <stdio.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "game_table/shared_game_table.h"
#include "launch/execution_wrapper.h"
#include "match/interrupt.h"
#include "match/match_config.h"
#include "match/orchestrator.h"
#include "match/supervisor.h"
#include "util/logging.h"
#include "util/status_macros.h"

ABSL_FLAG(std::string, map, "",
          "Map to play, relative to the StarCraft folder unless absolute.");
ABSL_FLAG(std::string, game_name, "skirmish", "Name of the LAN game.");
ABSL_FLAG(std::vector<std::string>, bots, {},
          "Bots to play, as name[:race[:executable]]. Names are folders in "
          "--bots_dir.");
ABSL_FLAG(std::vector<std::string>, bot_races, {},
          "Default races of bots, as name:race. A race in --bots overrides it "
          "for the match.");
ABSL_FLAG(std::vector<std::string>, player_names, {},
          "In-game names of bots, as name:player. Defaults to the bot name.");
ABSL_FLAG(std::vector<std::string>, headful, {},
          "Bots to run in a visible game window.");
ABSL_FLAG(bool, human_host, false,
          "A human hosts the game and every bot joins it.");
ABSL_FLAG(bool, human_speed, false, "Play at human speed.");
ABSL_FLAG(std::optional<int>, latency_frames, std::nullopt,
          "Latency frames passed to bwheadless.");
ABSL_FLAG(bool, tournament_module, false,
          "Load the tournament module matching each bot's BWAPI version.");
ABSL_FLAG(std::optional<int>, frame_timeout, std::nullopt,
          "Frame at which the tournament module ends the game.");
ABSL_FLAG(std::string, starcraft_path, "",
          "StarCraft folder. Defaults to StarCraft next to this executable.");
ABSL_FLAG(std::string, tools_dir, "",
          "Folder holding bwheadless, injectory and WMode. Defaults to tools "
          "next to this executable.");
ABSL_FLAG(std::string, bots_dir, "",
          "Folder holding one folder per bot. Defaults to bots next to this "
          "executable.");
ABSL_FLAG(std::string, java_path, "java", "Java used to run .jar bots.");
ABSL_FLAG(std::string, wrapper, "none",
          "Runs Windows executables with: none, wine or sandboxie.");
ABSL_FLAG(std::string, sandboxie_exe, "", "Sandboxie's Start.exe.");
ABSL_FLAG(std::string, sandboxie_box, "", "Sandboxie box to run bots in.");
ABSL_FLAG(std::string, game_table_name, game_table::kDefaultSharedMemoryName,
          "Name of the shared memory segment holding the game table.");
ABSL_FLAG(int, poll_interval_ms, 100,
          "Interval between game table checks while launching.");
ABSL_FLAG(int, poll_attempts, 100,
          "Game table checks before a launch step times out.");
ABSL_FLAG(int, supervise_interval_ms, 1000,
          "Interval between checks for finished games.");
ABSL_FLAG(std::string, log_file, "", "Also write the log to this file.");
ABSL_FLAG(std::string, verbosity, "info",
          "Log level: trace, debug, info, warning, error.");

namespace {

std::filesystem::path base_folder() {
  std::error_code ec;
  std::filesystem::path exe =
      std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) return std::filesystem::current_path();
  return exe.parent_path();
}

absl::StatusOr<std::filesystem::path> folder_flag(const std::string& value,
                                                  const std::string& fallback) {
  if (value.empty()) return base_folder() / fallback;
  std::error_code ec;
  std::filesystem::path path = std::filesystem::absolute(value, ec);
  if (ec) {
    return absl::InvalidArgumentError("Bad folder '" + value +
                                      "': " + ec.message());
  }
  return path;
}

absl::StatusOr<std::vector<match::BotEntry>> bot_entries() {
  std::vector<std::string> headful = absl::GetFlag(FLAGS_headful);
  std::vector<match::BotEntry> entries;
  for (const std::string& str : absl::GetFlag(FLAGS_bots)) {
    ASSIGN_OR_RETURN(match::BotEntry entry, match::parse_bot_entry(str));
    entry.config.headful =
        std::find(headful.begin(), headful.end(), entry.config.name) !=
        headful.end();
    entries.push_back(std::move(entry));
  }
  RETURN_IF_ERROR(match::apply_bot_defaults(absl::GetFlag(FLAGS_bot_races),
                                            absl::GetFlag(FLAGS_player_names),
                                            &entries));
  return entries;
}

absl::Status run_match(const absl::Notification& interrupted) {
  match::GameConfig game;
  game.map = absl::GetFlag(FLAGS_map);
  game.game_name = absl::GetFlag(FLAGS_game_name);
  game.human_host = absl::GetFlag(FLAGS_human_host);
  game.human_speed = absl::GetFlag(FLAGS_human_speed);
  game.latency_frames = absl::GetFlag(FLAGS_latency_frames);
  game.tournament_module = absl::GetFlag(FLAGS_tournament_module);
  game.timeout_at_frame = absl::GetFlag(FLAGS_frame_timeout);
  game.poll_budget.interval =
      std::chrono::milliseconds(absl::GetFlag(FLAGS_poll_interval_ms));
  game.poll_budget.attempts = absl::GetFlag(FLAGS_poll_attempts);
  game.supervise_interval =
      std::chrono::milliseconds(absl::GetFlag(FLAGS_supervise_interval_ms));

  match::Installation installation;
  ASSIGN_OR_RETURN(
      std::filesystem::path starcraft_dir,
      folder_flag(absl::GetFlag(FLAGS_starcraft_path), "StarCraft"));
  installation.starcraft_exe = starcraft_dir / "StarCraft.exe";
  ASSIGN_OR_RETURN(installation.tools_dir,
                   folder_flag(absl::GetFlag(FLAGS_tools_dir), "tools"));
  ASSIGN_OR_RETURN(installation.bots_dir,
                   folder_flag(absl::GetFlag(FLAGS_bots_dir), "bots"));
  installation.java_path = absl::GetFlag(FLAGS_java_path);
  ASSIGN_OR_RETURN(installation.wrapper,
                   launch::ExecutionWrapper::parse(
                       absl::GetFlag(FLAGS_wrapper),
                       absl::GetFlag(FLAGS_sandboxie_exe),
                       absl::GetFlag(FLAGS_sandboxie_box)));

  ASSIGN_OR_RETURN(std::vector<match::BotEntry> bots, bot_entries());
  RETURN_IF_ERROR(match::validate_game_config(game, installation, bots));

  game_table::SharedGameTable table(absl::GetFlag(FLAGS_game_table_name));
  absl::StatusOr<game_table::GameTable> current = table.snapshot();
  match::warn_about_setup(installation, bots,
                          current.ok() ? &*current : nullptr);

  match::SystemProcessLauncher launcher;
  std::chrono::milliseconds supervise_interval = game.supervise_interval;
  match::Orchestrator orchestrator(std::move(game), std::move(installation),
                                   table, launcher, &interrupted);
  ASSIGN_OR_RETURN(std::vector<bot::PreparedBot> prepared,
                   orchestrator.prepare(bots));
  ASSIGN_OR_RETURN(std::vector<match::ActiveInstance> instances,
                   orchestrator.launch(std::move(prepared)));

  match::Supervisor(supervise_interval, &interrupted).run(std::move(instances));
  return absl::OkStatus();
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Launches a BWAPI bot match and waits for its games to finish.");
  absl::ParseCommandLine(argc, argv);

  absl::Status status = init_logging(absl::GetFlag(FLAGS_verbosity),
                                     absl::GetFlag(FLAGS_log_file));
  if (!status.ok()) {
    fprintf(stderr, "%s\n", status.ToString().c_str());
    return 1;
  }

  absl::StatusOr<std::unique_ptr<match::InterruptWatcher>> watcher =
      match::InterruptWatcher::start();
  if (!watcher.ok()) {
    spdlog::error("{}", watcher.status().ToString());
    return 1;
  }

  status = run_match((*watcher)->interrupted());
  if (!status.ok()) {
    spdlog::error("{}", status.ToString());
    return 1;
  }
  spdlog::info("Done");
  return 0;
}

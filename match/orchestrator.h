#ifndef MATCH_ORCHESTRATOR_H_
#define MATCH_ORCHESTRATOR_H_

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"
#include "bot/prepared_bot.h"
#include "game_table/game_table.h"
#include "launch/bwheadless.h"
#include "launch/injectory.h"
#include "launch/launch_builder.h"
#include "match/match_config.h"
#include "match/supervisor.h"
#include "process/process.h"

namespace match {

// Starts the processes of a match.
class ProcessLauncher {
 public:
  virtual ~ProcessLauncher() = default;

  // 'env' is added on top of this process's environment.
  virtual absl::StatusOr<Process> launch(
      const std::vector<std::string>& args,
      const std::vector<std::pair<std::string, std::string>>& env,
      const std::filesystem::path& working_dir, ProcessOutConf&& out) = 0;
};

class SystemProcessLauncher : public ProcessLauncher {
 public:
  absl::StatusOr<Process> launch(
      const std::vector<std::string>& args,
      const std::vector<std::pair<std::string, std::string>>& env,
      const std::filesystem::path& working_dir,
      ProcessOutConf&& out) override;
};

// Moves bots that BWAPI loads into the game process ahead of client bots,
// keeping the order within each group. Client bots need a game already
// waiting for them.
void order_for_launch(std::vector<bot::PreparedBot>& bots);

// Sets up a match one bot at a time. The first bot hosts, unless a human
// does, and every other bot joins.
//
// For each bot the game process is started first. Client bots are then
// started once the game table shows a game waiting for a client, and the bot
// only counts as launched once it's connected. Every wait is bounded by the
// poll budget of the GameConfig.
//
// Any failure stops the setup. Processes of bots launched before the failure
// are left running.
class Orchestrator {
 public:
  Orchestrator(GameConfig game, Installation installation,
               game_table::GameTableReader& table, ProcessLauncher& launcher,
               const absl::Notification* cancel = nullptr)
      : game_(std::move(game)),
        installation_(std::move(installation)),
        table_(table),
        launcher_(launcher),
        cancel_(cancel) {}

  // Resolves the binary of every bot and creates their folders. Nothing is
  // launched if any bot fails to prepare.
  absl::StatusOr<std::vector<bot::PreparedBot>> prepare(
      const std::vector<BotEntry>& bots) const;

  // Launches 'bots' and returns them running and connected.
  absl::StatusOr<std::vector<ActiveInstance>> launch(
      std::vector<bot::PreparedBot> bots);

 private:
  launch::LaunchContext context_for(bool host, const std::string& game_name,
                                    int player_count) const;
  absl::StatusOr<ActiveInstance> launch_bot(
      const bot::PreparedBot& bot, const launch::LaunchContext& context);
  std::vector<std::string> client_command(const bot::PreparedBot& bot) const;
  absl::StatusOr<Process> spawn(
      const std::vector<std::string>& args,
      const std::vector<std::pair<std::string, std::string>>& env,
      const std::filesystem::path& working_dir,
      const std::filesystem::path& out_log,
      const std::filesystem::path& err_log);

  // Connected clients in the game table, 0 while there's no table.
  size_t connected_count();
  absl::Status wait_for_free_slot(Process& game);
  absl::Status wait_for_connection(Process& game, Process& client,
                                   size_t connected_before);

  GameConfig game_;
  Installation installation_;
  game_table::GameTableReader& table_;
  ProcessLauncher& launcher_;
  const absl::Notification* cancel_;
  launch::BwHeadless bwheadless_;
  launch::Injectory injectory_;
};

}  // namespace match

#endif

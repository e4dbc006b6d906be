#include "match/orchestrator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "match/poll.h"
#include "process/env_vars.h"
#include "util/status_macros.h"

namespace match {

namespace {

// Prefixes 'status' with the bot and the setup stage that failed.
absl::Status with_context(const absl::Status& status, const std::string& name,
                          const std::string& stage) {
  return absl::Status(status.code(), absl::StrCat("Bot '", name,
                                                  "' failed to ", stage, ": ",
                                                  status.message()));
}

}  // namespace

absl::StatusOr<Process> SystemProcessLauncher::launch(
    const std::vector<std::string>& args,
    const std::vector<std::pair<std::string, std::string>>& env,
    const std::filesystem::path& working_dir, ProcessOutConf&& out) {
  EnvVars env_vars = EnvVars::environ();
  for (const auto& [var, val] : env) {
    env_vars.set_var(var, val);
  }
  return launch_process(args, &env_vars, std::move(out), working_dir);
}

void order_for_launch(std::vector<bot::PreparedBot>& bots) {
  std::stable_partition(
      bots.begin(), bots.end(),
      [](const bot::PreparedBot& bot) { return !bot.binary.is_client(); });
}

absl::StatusOr<std::vector<bot::PreparedBot>> Orchestrator::prepare(
    const std::vector<BotEntry>& bots) const {
  bot::PrepareOptions options{
      .tournament_module = game_.tournament_module,
      .tm_dir = installation_.tm_dir(),
  };
  if (game_.tournament_module) {
    ASSIGN_OR_RETURN(options.tm_table,
                     bot::load_tournament_modules(
                         installation_.tm_dir() / bot::kTournamentModuleTable));
  }

  std::vector<bot::PreparedBot> prepared;
  for (const BotEntry& entry : bots) {
    std::filesystem::path dir = installation_.bots_dir / entry.config.name;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
      return absl::FailedPreconditionError(
          absl::StrCat("Folder for bot '", entry.config.name,
                       "' not found: '", dir.string(), "'"));
    }
    absl::StatusOr<bot::PreparedBot> bot =
        bot::PreparedBot::prepare(entry.config, dir, entry.definition, options);
    if (!bot.ok()) {
      return with_context(bot.status(), entry.config.name, "prepare");
    }
    prepared.push_back(std::move(*bot));
  }
  return prepared;
}

absl::StatusOr<std::vector<ActiveInstance>> Orchestrator::launch(
    std::vector<bot::PreparedBot> bots) {
  order_for_launch(bots);
  int player_count = static_cast<int>(bots.size());

  // Without a human host, the first bot hosts.
  bool host = !game_.human_host;
  std::string game_name = game_.game_name;

  std::vector<ActiveInstance> instances;
  for (const bot::PreparedBot& bot : bots) {
    // BWAPI can't host a LAN game under a name other than its player's.
    if (bot.headful && host) game_name = bot.name;

    if (host) {
      spdlog::info("Hosting game with '{}'", bot.name);
    } else {
      spdlog::info("Joining game with '{}'", bot.name);
    }
    ASSIGN_OR_RETURN(
        ActiveInstance instance,
        launch_bot(bot, context_for(host, game_name, player_count)));
    instances.push_back(std::move(instance));
    host = false;
  }
  return instances;
}

launch::LaunchContext Orchestrator::context_for(bool host,
                                                const std::string& game_name,
                                                int player_count) const {
  launch::LaunchContext context;
  context.starcraft_exe = installation_.starcraft_exe;
  context.tools_dir = installation_.tools_dir;
  context.wrapper = installation_.wrapper;
  context.game_name = game_name;
  if (host) {
    context.connect_mode = launch::ConnectMode::Host(game_.map, player_count);
  }
  context.latency_frames = game_.latency_frames;
  context.game_speed = game_.human_speed ? -1 : 0;
  context.timeout_at_frame = game_.timeout_at_frame;
  return context;
}

absl::StatusOr<ActiveInstance> Orchestrator::launch_bot(
    const bot::PreparedBot& bot, const launch::LaunchContext& context) {
  const launch::LaunchBuilder& builder =
      bot.headful ? static_cast<const launch::LaunchBuilder&>(injectory_)
                  : bwheadless_;
  absl::StatusOr<launch::LaunchPlan> plan = builder.build(bot, context);
  if (!plan.ok()) {
    return with_context(plan.status(), bot.name, "build its game command");
  }

  size_t connected_before = connected_count();

  ActiveInstance instance{.name = bot.name};
  absl::StatusOr<Process> game =
      spawn(plan->args, plan->env, plan->working_dir,
            bot.log_dir / "game_out.log", bot.log_dir / "game_err.log");
  if (!game.ok()) {
    return with_context(game.status(), bot.name, "start its game");
  }
  instance.game = std::move(*game);
  spdlog::debug("Game of '{}' started as pid {} ({})", bot.name,
                instance.game.pid, launch::to_string(plan->role));

  // BWAPI loads DLL bots itself.
  if (!bot.binary.is_client()) return instance;

  absl::Status status = wait_for_free_slot(instance.game);
  if (!status.ok()) {
    return with_context(status, bot.name, "wait for its game to be ready");
  }

  absl::StatusOr<Process> client =
      spawn(client_command(bot), {}, bot.working_dir,
            bot.log_dir / "bot_out.log", bot.log_dir / "bot_err.log");
  if (!client.ok()) {
    return with_context(client.status(), bot.name, "start its bot process");
  }
  instance.bot = std::move(*client);
  spdlog::debug("Bot process of '{}' started as pid {}", bot.name,
                instance.bot->pid);

  status = wait_for_connection(instance.game, *instance.bot, connected_before);
  if (!status.ok()) return with_context(status, bot.name, "connect");
  return instance;
}

std::vector<std::string> Orchestrator::client_command(
    const bot::PreparedBot& bot) const {
  if (bot.binary.kind == bot::Binary::Kind::JAR) {
    return {installation_.java_path, "-jar", bot.binary.path.string()};
  }
  return installation_.wrapper.wrap(bot.binary.path);
}

absl::StatusOr<Process> Orchestrator::spawn(
    const std::vector<std::string>& args,
    const std::vector<std::pair<std::string, std::string>>& env,
    const std::filesystem::path& working_dir,
    const std::filesystem::path& out_log,
    const std::filesystem::path& err_log) {
  ProcessOutConf out;
  ASSIGN_OR_RETURN(out.stdout, StreamOutConf::LogFile(out_log));
  ASSIGN_OR_RETURN(out.stderr, StreamOutConf::LogFile(err_log));
  return launcher_.launch(args, env, working_dir, std::move(out));
}

size_t Orchestrator::connected_count() {
  absl::StatusOr<game_table::GameTable> table = table_.snapshot();
  if (!table.ok()) {
    spdlog::debug("No game table: {}", table.status().ToString());
    return 0;
  }
  return table->connected_count();
}

absl::Status Orchestrator::wait_for_free_slot(Process& game) {
  return poll_until(
      [&]() -> absl::StatusOr<bool> {
        ASSIGN_OR_RETURN(bool exited, game.try_wait());
        if (exited) {
          return absl::AbortedError("host died before it was ready");
        }
        absl::StatusOr<game_table::GameTable> table = table_.snapshot();
        if (absl::IsUnavailable(table.status())) return false;
        RETURN_IF_ERROR(table);
        return table->has_free_slot();
      },
      game_.poll_budget, "a game waiting for a client", cancel_);
}

absl::Status Orchestrator::wait_for_connection(Process& game, Process& client,
                                               size_t connected_before) {
  return poll_until(
      [&]() -> absl::StatusOr<bool> {
        ASSIGN_OR_RETURN(bool game_exited, game.try_wait());
        if (game_exited) {
          return absl::AbortedError("host died before client connected");
        }
        ASSIGN_OR_RETURN(bool client_exited, client.try_wait());
        if (client_exited) {
          return absl::AbortedError("client died before connecting");
        }
        return connected_count() > connected_before;
      },
      game_.poll_budget, "the bot to connect", cancel_);
}

}  // namespace match

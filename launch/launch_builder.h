#ifndef LAUNCH_LAUNCH_BUILDER_H_
#define LAUNCH_LAUNCH_BUILDER_H_

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "bot/prepared_bot.h"
#include "launch/connect_mode.h"
#include "launch/execution_wrapper.h"

namespace launch {

// Where BWAPI looks for its ini. Older BWAPI versions find it through the
// install path in the registry, which isn't reliable, so we always set it.
inline constexpr char kBwapiConfigIniEnv[] = "BWAPI_CONFIG_INI";
// Read by the tournament module.
inline constexpr char kResultsFileEnv[] = "TM_LOG_RESULTS";
inline constexpr char kFrameTimesFileEnv[] = "TM_LOG_FRAMETIMES";
inline constexpr char kTimeoutAtFrameEnv[] = "TM_TIMEOUT_AT_FRAME";

// How to start one bot's game process.
struct LaunchPlan {
  std::vector<std::string> args;
  // Added on top of the parent's environment.
  std::vector<std::pair<std::string, std::string>> env;
  std::filesystem::path working_dir;
  // The generated bwapi.ini.
  std::filesystem::path config_path;
  Role role = Role::JOIN;
};

// Match-wide launch settings.
struct LaunchContext {
  std::filesystem::path starcraft_exe;
  // Holds bwheadless.exe, injectory_x86.exe and WMode.dll.
  std::filesystem::path tools_dir;
  ExecutionWrapper wrapper = ExecutionWrapper::None();
  std::string game_name;
  ConnectMode connect_mode;
  // Passed to bwheadless with -gs when set.
  std::optional<int> latency_frames;
  // 0 is full speed, -1 human speed.
  int game_speed = 0;
  std::optional<int> timeout_at_frame;
  // Run injected games in a window.
  bool wmode = true;
};

// Builds the command that starts a bot's game, and writes the bwapi.ini that
// game will read.
class LaunchBuilder {
 public:
  virtual ~LaunchBuilder() = default;

  // Returns FAILED_PRECONDITION naming the missing file if StarCraft, the
  // bot's BWAPI files or the launcher tool can't be found.
  virtual absl::StatusOr<LaunchPlan> build(
      const bot::PreparedBot& bot, const LaunchContext& context) const = 0;
};

namespace internal {

// Checks the files every launch needs.
absl::Status check_game_files(const bot::PreparedBot& bot,
                              const LaunchContext& context);

// Checks that a launcher tool was extracted into the tools folder.
absl::Status check_tool(const std::filesystem::path& tool,
                        const std::filesystem::path& tools_dir);

// Fills in the environment, working directory and role shared by every plan.
void set_common_plan_fields(const bot::PreparedBot& bot,
                            const LaunchContext& context,
                            const std::filesystem::path& ini,
                            LaunchPlan* plan);

// The ai module entry for bwapi.ini.
std::string ai_module_for(const bot::PreparedBot& bot);

}  // namespace internal

}  // namespace launch

#endif

#include "launch/launch_builder.h"

#include "util/file_checks.h"
#include "util/status_macros.h"

namespace launch {
namespace internal {

absl::Status check_game_files(const bot::PreparedBot& bot,
                              const LaunchContext& context) {
  ASSIGN_OR_RETURN(bool starcraft_found, path_exists(context.starcraft_exe));
  if (!starcraft_found) {
    return absl::FailedPreconditionError("StarCraft.exe not found here: " +
                                         context.starcraft_exe.string());
  }
  ASSIGN_OR_RETURN(bool bwapi_data_found, path_exists(bot.bwapi_data()));
  if (!bwapi_data_found) {
    return absl::FailedPreconditionError(
        "Missing '" + bot.bwapi_data().string() +
        "' - please read the instructions on how to setup a bot.");
  }
  ASSIGN_OR_RETURN(bool bwapi_dll_found, path_exists(bot.bwapi_dll()));
  if (!bwapi_dll_found) {
    return absl::FailedPreconditionError("Could not find '" +
                                         bot.bwapi_dll().string() + "'");
  }
  return absl::OkStatus();
}

absl::Status check_tool(const std::filesystem::path& tool,
                        const std::filesystem::path& tools_dir) {
  ASSIGN_OR_RETURN(bool found, path_exists(tool));
  if (!found) {
    return absl::FailedPreconditionError(
        "Could not find '" + tool.string() + "'. Please make sure to extract "
        "all files into '" + tools_dir.string() +
        "', or check your antivirus software.");
  }
  return absl::OkStatus();
}

void set_common_plan_fields(const bot::PreparedBot& bot,
                            const LaunchContext& context,
                            const std::filesystem::path& ini,
                            LaunchPlan* plan) {
  plan->env.emplace_back(kBwapiConfigIniEnv, ini.string());
  plan->env.emplace_back(kResultsFileEnv,
                         (bot.log_dir / "result.txt").string());
  plan->env.emplace_back(kFrameTimesFileEnv,
                         (bot.log_dir / "frametimes.txt").string());
  if (context.timeout_at_frame) {
    plan->env.emplace_back(kTimeoutAtFrameEnv,
                           std::to_string(*context.timeout_at_frame));
  }
  plan->working_dir = bot.working_dir;
  plan->config_path = ini;
  plan->role = context.connect_mode.role;
}

std::string ai_module_for(const bot::PreparedBot& bot) {
  if (bot.binary.kind == bot::Binary::Kind::DLL) {
    return bot.binary.path.string();
  }
  return "";
}

}  // namespace internal
}  // namespace launch

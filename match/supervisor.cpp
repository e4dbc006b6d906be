#include "match/supervisor.h"

#include <spdlog/spdlog.h>

#include <thread>

#include "absl/time/time.h"

namespace match {

namespace {
bool game_exited(ActiveInstance& instance) {
  absl::StatusOr<bool> exited = instance.game.try_wait();
  if (!exited.ok()) {
    // We can't watch this game anymore, so treat it as gone.
    spdlog::error("Lost track of the game of '{}': {}", instance.name,
                  exited.status().ToString());
    return true;
  }
  return *exited;
}

void stop(Process& process, const std::string& what,
          const std::string& name) {
  absl::Status s = process.terminate(kTeardownGrace);
  if (!s.ok()) {
    spdlog::error("Failed to stop the {} of '{}': {}", what, name,
                  s.ToString());
  }
}
}  // namespace

size_t Supervisor::reap(std::vector<ActiveInstance>& instances) {
  for (size_t i = instances.size(); i-- > 0;) {
    ActiveInstance& instance = instances[i];
    if (!game_exited(instance)) continue;

    if (instance.bot) {
      absl::Status s = instance.bot->kill();
      if (!s.ok()) {
        spdlog::error("Failed to kill the bot process of '{}': {}",
                      instance.name, s.ToString());
      }
    }
    spdlog::debug("Game of '{}' exited", instance.name);
    instances.erase(instances.begin() + i);
    spdlog::info("{} bots remaining", instances.size());
  }
  return instances.size();
}

void Supervisor::run(std::vector<ActiveInstance> instances) {
  while (reap(instances) > 0) {
    if (cancel_) {
      if (cancel_->WaitForNotificationWithTimeout(
              absl::FromChrono(interval_))) {
        spdlog::info("Interrupted, stopping {} bots", instances.size());
        teardown(instances);
        return;
      }
    } else {
      std::this_thread::sleep_for(interval_);
    }
  }
}

void Supervisor::teardown(std::vector<ActiveInstance>& instances) {
  for (ActiveInstance& instance : instances) {
    if (instance.bot) stop(*instance.bot, "bot process", instance.name);
    stop(instance.game, "game", instance.name);
  }
  instances.clear();
}

}  // namespace match

#ifndef MATCH_SUPERVISOR_H_
#define MATCH_SUPERVISOR_H_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "absl/synchronization/notification.h"
#include "process/process.h"

namespace match {

// A launched bot: its game process and, for client bots, the bot process
// connected to it.
struct ActiveInstance {
  std::string name;
  Process game;
  std::optional<Process> bot;
};

// How long a process gets to exit after SIGTERM before it's killed.
inline constexpr std::chrono::milliseconds kTeardownGrace{2000};

// Owns the instances of a running match until their games exit.
class Supervisor {
 public:
  explicit Supervisor(std::chrono::milliseconds interval,
                      const absl::Notification* cancel = nullptr)
      : interval_(interval), cancel_(cancel) {}

  // Blocks until every game has exited. A bot whose game exited is killed
  // right away, since it would otherwise keep polling the game table.
  //
  // If 'cancel' is notified, terminates every remaining instance and
  // returns.
  void run(std::vector<ActiveInstance> instances);

  // Removes the instances whose game has exited, killing their bots. Returns
  // the number of instances left.
  size_t reap(std::vector<ActiveInstance>& instances);

 private:
  void teardown(std::vector<ActiveInstance>& instances);

  std::chrono::milliseconds interval_;
  const absl::Notification* cancel_;
};

}  // namespace match

#endif

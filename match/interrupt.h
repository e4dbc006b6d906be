#ifndef MATCH_INTERRUPT_H_
#define MATCH_INTERRUPT_H_

#include <signal.h>

#include <atomic>
#include <memory>
#include <thread>

#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"

namespace match {

// Turns SIGINT and SIGTERM into a notification that the match waits can be
// cancelled with.
class InterruptWatcher {
 public:
  // Blocks SIGINT and SIGTERM in the calling thread and starts a thread that
  // waits for them. Threads created afterwards inherit the blocked mask, so
  // call this before starting any other thread.
  static absl::StatusOr<std::unique_ptr<InterruptWatcher>> start();

  // Stops watching and restores the calling thread's signal mask.
  ~InterruptWatcher();

  InterruptWatcher(const InterruptWatcher&) = delete;
  InterruptWatcher& operator=(const InterruptWatcher&) = delete;

  // Notified when the first SIGINT or SIGTERM arrives. A second one ends the
  // process right away, without waiting for teardown.
  const absl::Notification& interrupted() const { return interrupted_; }

 private:
  InterruptWatcher() = default;
  void watch();
  void force_exit(int sig);

  sigset_t signals_;
  sigset_t old_mask_;
  std::atomic<bool> stopping_{false};
  absl::Notification interrupted_;
  std::thread thread_;
};

}  // namespace match

#endif

#include "match/interrupt.h"

#include <errno.h>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <string.h>
#include <unistd.h>

#include "util/libc_error.h"

namespace match {

namespace {
const timespec kWatchTimeout = {.tv_sec = 0, .tv_nsec = 100'000'000};
}  // namespace

absl::StatusOr<std::unique_ptr<InterruptWatcher>> InterruptWatcher::start() {
  std::unique_ptr<InterruptWatcher> watcher(new InterruptWatcher());
  sigemptyset(&watcher->signals_);
  sigaddset(&watcher->signals_, SIGINT);
  sigaddset(&watcher->signals_, SIGTERM);
  int r =
      pthread_sigmask(SIG_BLOCK, &watcher->signals_, &watcher->old_mask_);
  if (r != 0) {
    return absl::InternalError("pthread_sigmask failed: " +
                               libc_error_name(r));
  }
  watcher->thread_ = std::thread(&InterruptWatcher::watch, watcher.get());
  return watcher;
}

InterruptWatcher::~InterruptWatcher() {
  stopping_ = true;
  if (thread_.joinable()) thread_.join();
  pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
}

void InterruptWatcher::watch() {
  while (!stopping_) {
    int sig = sigtimedwait(&signals_, nullptr, &kWatchTimeout);
    if (sig < 0) {
      if (errno != EAGAIN && errno != EINTR) {
        spdlog::error("sigtimedwait failed: {}", libc_error_name(errno));
        return;
      }
      continue;
    }
    if (!interrupted_.HasBeenNotified()) {
      spdlog::info("Received {}, shutting down", sigabbrev_np(sig));
      interrupted_.Notify();
      continue;
    }
    spdlog::warn("Received {} again, exiting without cleanup",
                 sigabbrev_np(sig));
    spdlog::default_logger()->flush();
    force_exit(sig);
    return;
  }
}

void InterruptWatcher::force_exit(int sig) {
  // Nothing installs handlers for these, so unblocking lets the default
  // action end the process.
  int r = pthread_sigmask(SIG_UNBLOCK, &signals_, nullptr);
  if (r != 0) {
    spdlog::error("pthread_sigmask failed: {}", libc_error_name(r));
    _exit(128 + sig);
  }
  raise(sig);
}

}  // namespace match

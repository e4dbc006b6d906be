#ifndef PROCESS_PROCESS_HELPERS_H_
#define PROCESS_PROCESS_HELPERS_H_

#include <spawn.h>

#include <filesystem>
#include <vector>

#include "absl/status/status.h"
#include "process/stream.h"

struct ProcessOutConf {
  StreamOutConf stdout = StreamOutConf::None();
  StreamOutConf stderr = StreamOutConf::None();
};

// Spawn file actions and attributes plus the parent's ends of any redirected
// streams. Destroys the actions and attributes when it goes out of scope.
struct PrelaunchOut {
  PrelaunchOut() {
    posix_spawn_file_actions_init(&file_actions);
    posix_spawnattr_init(&attr);
  }
  ~PrelaunchOut() {
    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attr);
  }

  PrelaunchOut(const PrelaunchOut&) = delete;
  PrelaunchOut& operator=(const PrelaunchOut&) = delete;

  posix_spawn_file_actions_t file_actions;
  posix_spawnattr_t attr;
  StreamOut stdout;
  StreamOut stderr;
  // Descriptors the child needs until exec, closed in the parent once the
  // child has been spawned.
  std::vector<Fd> close_after_spawn;
};

absl::Status validate_process_out_conf(const ProcessOutConf& conf);

// Fills in 'out' with the file actions that redirect the child's streams as
// 'out_conf' describes and switch to 'working_dir' if it's non-empty. The
// child always starts with an empty signal mask, whatever the parent blocks.
absl::Status process_streams_prelaunch(ProcessOutConf&& out_conf,
                                       const std::filesystem::path& working_dir,
                                       PrelaunchOut* out);

#endif

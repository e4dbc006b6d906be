#ifndef PROCESS_PROCESS_H_
#define PROCESS_PROCESS_H_

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "process/env_vars.h"
#include "process/process_helpers.h"
#include "process/stream.h"

// Handle to a spawned child process. Handles are move-only; the process isn't
// signalled or waited on when its handle is destroyed.
class Process {
 public:
  Process() = default;
  Process(Process&& other) noexcept;
  Process& operator=(Process&& other) noexcept;

  // Returns true once the process has exited. The process is reaped the first
  // time its exit is observed.
  absl::StatusOr<bool> try_wait();

  // Sends SIGKILL and reaps the process. Does nothing if it's already exited.
  absl::Status kill();

  // Sends SIGTERM and gives the process 'grace' to exit before falling back
  // to kill().
  absl::Status terminate(std::chrono::milliseconds grace);

  // The raw waitpid status, once the process has been reaped.
  std::optional<int> wait_status() const;

  int pid = -1;
  StreamOut stdout;
  StreamOut stderr;

 private:
  bool exited_ = false;
  int wait_status_ = 0;
};

// If no environment is passed in. Defaults to using the parent process's
// environment. To get an empty environment, default construct an EnvVars
// instance.
//
// ProcessOutConf must be moved into launch_process, since it may own FDs and
// launch process takes ownership of any specified passed in FDs.
//
// A non-empty 'working_dir' is the child's working directory. Relative paths
// in 'args' resolve against it.
absl::StatusOr<Process> launch_process(
    const std::vector<std::string>& args, EnvVars* env_vars = nullptr,
    ProcessOutConf&& process_out = ProcessOutConf(),
    const std::filesystem::path& working_dir = {});

#endif

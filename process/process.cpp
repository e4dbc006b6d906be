#include "process/process.h"

#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <thread>

#include "util/libc_error.h"
#include "util/status_macros.h"

namespace {
using std::chrono::milliseconds;
using std::chrono::steady_clock;

const milliseconds kTerminatePoll = milliseconds(10);
}  // namespace

Process::Process(Process&& other) noexcept
    : pid(other.pid),
      stdout(std::move(other.stdout)),
      stderr(std::move(other.stderr)),
      exited_(other.exited_),
      wait_status_(other.wait_status_) {
  other.pid = -1;
}

Process& Process::operator=(Process&& other) noexcept {
  if (this != &other) {
    pid = other.pid;
    stdout = std::move(other.stdout);
    stderr = std::move(other.stderr);
    exited_ = other.exited_;
    wait_status_ = other.wait_status_;
    other.pid = -1;
  }
  return *this;
}

absl::StatusOr<bool> Process::try_wait() {
  if (exited_) return true;
  if (pid <= 0) return absl::FailedPreconditionError("No process to wait on");

  while (true) {
    int status = 0;
    int r = waitpid(pid, &status, WNOHANG);
    if (r == 0) return false;
    if (r == pid) {
      exited_ = true;
      wait_status_ = status;
      return true;
    }
    if (errno == EINTR) continue;
    if (errno == ECHILD) {
      // Someone else reaped it.
      exited_ = true;
      return true;
    }
    return absl::InternalError("waitpid(" + std::to_string(pid) +
                               ") failed: " + libc_error_name(errno));
  }
}

absl::Status Process::kill() {
  ASSIGN_OR_RETURN(bool exited, try_wait());
  if (exited) return absl::OkStatus();

  if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
    return absl::InternalError("kill(" + std::to_string(pid) +
                               ") failed: " + libc_error_name(errno));
  }
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno == EINTR) continue;
    if (errno != ECHILD) {
      return absl::InternalError("waitpid(" + std::to_string(pid) +
                                 ") failed: " + libc_error_name(errno));
    }
    break;
  }
  exited_ = true;
  wait_status_ = status;
  return absl::OkStatus();
}

absl::Status Process::terminate(milliseconds grace) {
  ASSIGN_OR_RETURN(bool exited, try_wait());
  if (exited) return absl::OkStatus();

  if (::kill(pid, SIGTERM) != 0 && errno != ESRCH) {
    return absl::InternalError("kill(" + std::to_string(pid) +
                               ") failed: " + libc_error_name(errno));
  }
  auto start = steady_clock::now();
  while (steady_clock::now() - start < grace) {
    ASSIGN_OR_RETURN(exited, try_wait());
    if (exited) return absl::OkStatus();
    std::this_thread::sleep_for(kTerminatePoll);
  }
  return kill();
}

std::optional<int> Process::wait_status() const {
  if (!exited_) return std::nullopt;
  return wait_status_;
}

absl::StatusOr<Process> launch_process(const std::vector<std::string>& args,
                                       EnvVars* env_vars,
                                       ProcessOutConf&& process_out,
                                       const std::filesystem::path& working_dir) {
  if (args.empty()) {
    return absl::InvalidArgumentError("Can't launch an empty command");
  }
  RETURN_IF_ERROR(validate_process_out_conf(process_out));

  std::vector<char*> argv;
  for (const std::string& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  char** env = env_vars ? env_vars->vars() : environ;

  PrelaunchOut prelaunch_out;
  RETURN_IF_ERROR(process_streams_prelaunch(std::move(process_out),
                                            working_dir, &prelaunch_out));
  int pid;
  int r = posix_spawnp(&pid, argv[0], &prelaunch_out.file_actions,
                       &prelaunch_out.attr, argv.data(), env);
  if (r != 0) {
    return absl::InvalidArgumentError("Failed to launch process '" + args[0] +
                                      "': " + libc_error_name(r));
  }
  Process p;
  p.pid = pid;
  p.stdout = std::move(prelaunch_out.stdout);
  p.stderr = std::move(prelaunch_out.stderr);
  prelaunch_out.close_after_spawn.clear();
  return p;
}

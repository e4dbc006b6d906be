#include "process/process_helpers.h"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

#include "util/libc_error.h"
#include "util/status_macros.h"

namespace {
absl::Status check_spawn_call(int r, const char* what) {
  if (r != 0) {
    return absl::InternalError(std::string(what) + " failed: " +
                               libc_error_name(r));
  }
  return absl::OkStatus();
}

absl::Status make_pipe(int p[2]) {
  if (pipe2(p, O_CLOEXEC) != 0) {
    return absl::InternalError("pipe2 failed: " + libc_error_name(errno));
  }
  return absl::OkStatus();
}
}  // namespace

absl::Status validate_process_out_conf(const ProcessOutConf& conf) {
  if (conf.stderr.kind() == StreamKind::STDOUT_PIPE &&
      conf.stdout.kind() != StreamKind::PIPE) {
    return absl::InvalidArgumentError(
        "ProcessOutConf with stderr = StdoutPipe and stdout != Pipe isn't "
        "valid.");
  }
  if (conf.stdout.kind() == StreamKind::STDOUT_PIPE) {
    return absl::InvalidArgumentError(
        "ProcessOutConf with stdout = StdoutPipe isn't valid.");
  }
  return absl::OkStatus();
}

absl::Status process_streams_prelaunch(ProcessOutConf&& out_conf,
                                       const std::filesystem::path& working_dir,
                                       PrelaunchOut* out) {
  posix_spawn_file_actions_t* actions = &out->file_actions;

  // Each input can be one of NONE, PIPE, STDOUT_PIPE, or FILE. All of our
  // descriptors are close-on-exec, so only the dup2'd copies reach the child.
  int stdout_write_fd = -1;
  switch (out_conf.stdout.kind()) {
    case StreamKind::PIPE: {
      int p[2];
      RETURN_IF_ERROR(make_pipe(p));
      out->stdout = StreamOut(StreamKind::PIPE, Fd::take(p[0]));
      out->close_after_spawn.push_back(Fd::take(p[1]));
      RETURN_IF_ERROR(check_spawn_call(
          posix_spawn_file_actions_adddup2(actions, p[1], STDOUT_FILENO),
          "adddup2"));
      stdout_write_fd = p[1];
      break;
    }
    case StreamKind::FILE: {
      out->stdout = StreamOut(StreamKind::FILE, out_conf.stdout.take_fd());
      RETURN_IF_ERROR(check_spawn_call(
          posix_spawn_file_actions_adddup2(actions, out->stdout.fd(),
                                           STDOUT_FILENO),
          "adddup2"));
      break;
    }
    case StreamKind::NONE:
    case StreamKind::STDOUT_PIPE: {
      // Nothing to do.
      break;
    }
  }

  switch (out_conf.stderr.kind()) {
    case StreamKind::PIPE: {
      int p[2];
      RETURN_IF_ERROR(make_pipe(p));
      out->stderr = StreamOut(StreamKind::PIPE, Fd::take(p[0]));
      out->close_after_spawn.push_back(Fd::take(p[1]));
      RETURN_IF_ERROR(check_spawn_call(
          posix_spawn_file_actions_adddup2(actions, p[1], STDERR_FILENO),
          "adddup2"));
      break;
    }
    case StreamKind::STDOUT_PIPE: {
      RETURN_IF_ERROR(check_spawn_call(
          posix_spawn_file_actions_adddup2(actions, stdout_write_fd,
                                           STDERR_FILENO),
          "adddup2"));
      break;
    }
    case StreamKind::FILE: {
      out->stderr = StreamOut(StreamKind::FILE, out_conf.stderr.take_fd());
      RETURN_IF_ERROR(check_spawn_call(
          posix_spawn_file_actions_adddup2(actions, out->stderr.fd(),
                                           STDERR_FILENO),
          "adddup2"));
      break;
    }
    case StreamKind::NONE: {
      // Nothing to do.
      break;
    }
  }

  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  RETURN_IF_ERROR(check_spawn_call(
      posix_spawnattr_setsigmask(&out->attr, &empty_mask), "setsigmask"));
  RETURN_IF_ERROR(check_spawn_call(
      posix_spawnattr_setflags(&out->attr, POSIX_SPAWN_SETSIGMASK),
      "setflags"));

  if (!working_dir.empty()) {
    RETURN_IF_ERROR(check_spawn_call(
        posix_spawn_file_actions_addchdir_np(actions, working_dir.c_str()),
        "addchdir"));
  }
  return absl::OkStatus();
}

#include "process/process.h"

#include <gtest/gtest.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "util/status_gtest.h"

namespace {

using std::chrono::milliseconds;
using std::this_thread::sleep_for;

absl::StatusOr<Process> run_test(StreamOutConf&& stdout,
                                 StreamOutConf&& stderr) {
  auto p = launch_process(
      {"sh", "-c", R"(printf "test_out"; printf "test_err" 1>&2;)"},
      /*env=*/nullptr,
      ProcessOutConf{.stdout = std::move(stdout), .stderr = std::move(stderr)});
  sleep_for(milliseconds(50));
  return p;
}

std::string read_fd(int fd) {
  char buf[256];
  int r = read(fd, &buf, sizeof(buf) - 1);
  if (r < 0) r = 0;
  buf[r] = '\0';
  return std::string(buf);
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Polls try_wait() until the process exits or 'timeout' passes.
bool wait_for_exit(Process& p, milliseconds timeout = milliseconds(2000)) {
  auto start = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() - start < timeout) {
    absl::StatusOr<bool> exited = p.try_wait();
    if (exited.ok() && *exited) return true;
    sleep_for(milliseconds(10));
  }
  return false;
}

class ProcessTest : public testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("process_test_" + std::to_string(getpid()));
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::filesystem::path dir_;
};

}  // namespace

TEST_F(ProcessTest, no_capture_test) {
  ASSERT_OK_AND_ASSIGN(Process p,
                       run_test(StreamOutConf::None(), StreamOutConf::None()));

  EXPECT_FALSE(p.stdout.is_pipe());
  EXPECT_FALSE(p.stderr.is_pipe());
}

TEST_F(ProcessTest, capture_stdout) {
  ASSERT_OK_AND_ASSIGN(Process p,
                       run_test(StreamOutConf::Pipe(), StreamOutConf::None()));

  EXPECT_TRUE(p.stdout.is_pipe());
  EXPECT_EQ(read_fd(p.stdout.fd()), "test_out");
  EXPECT_FALSE(p.stderr.is_pipe());
}

TEST_F(ProcessTest, capture_stderr) {
  ASSERT_OK_AND_ASSIGN(Process p,
                       run_test(StreamOutConf::None(), StreamOutConf::Pipe()));

  EXPECT_TRUE(p.stderr.is_pipe());
  EXPECT_EQ(read_fd(p.stderr.fd()), "test_err");
  EXPECT_FALSE(p.stdout.is_pipe());
}

TEST_F(ProcessTest, capture_merged_out) {
  ASSERT_OK_AND_ASSIGN(
      Process p, run_test(StreamOutConf::Pipe(), StreamOutConf::StdoutPipe()));

  EXPECT_TRUE(p.stdout.is_pipe());
  EXPECT_EQ(read_fd(p.stdout.fd()), "test_outtest_err");
}

TEST_F(ProcessTest, stdout_pipe_on_stdout_is_rejected) {
  absl::StatusOr<Process> p = launch_process(
      {"true"}, nullptr,
      ProcessOutConf{.stdout = StreamOutConf::StdoutPipe()});
  EXPECT_EQ(p.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(ProcessTest, redirects_to_log_files) {
  ASSERT_OK_AND_ASSIGN(StreamOutConf out,
                       StreamOutConf::LogFile(dir_ / "out.log"));
  ASSERT_OK_AND_ASSIGN(StreamOutConf err,
                       StreamOutConf::LogFile(dir_ / "err.log"));
  ASSERT_OK_AND_ASSIGN(
      Process p,
      launch_process({"sh", "-c", R"(printf "to_out"; printf "to_err" 1>&2;)"},
                     nullptr,
                     ProcessOutConf{.stdout = std::move(out),
                                    .stderr = std::move(err)}));
  ASSERT_TRUE(wait_for_exit(p));

  EXPECT_EQ(read_file(dir_ / "out.log"), "to_out");
  EXPECT_EQ(read_file(dir_ / "err.log"), "to_err");
}

TEST_F(ProcessTest, runs_in_working_dir) {
  ASSERT_OK_AND_ASSIGN(
      Process p, launch_process({"sh", "-c", "pwd"}, nullptr,
                                ProcessOutConf{.stdout = StreamOutConf::Pipe()},
                                dir_));
  ASSERT_TRUE(wait_for_exit(p));

  EXPECT_EQ(read_fd(p.stdout.fd()),
            std::filesystem::canonical(dir_).string() + "\n");
}

TEST_F(ProcessTest, passes_environment) {
  EnvVars env = EnvVars::environ();
  env.set_var("PROCESS_TEST_VAR", "first");
  env.set_var("PROCESS_TEST_VAR", "second");
  EXPECT_EQ(env.get_var("PROCESS_TEST_VAR"), "second");
  EXPECT_EQ(env.get_var("PROCESS_TEST_UNSET"), std::nullopt);
  ASSERT_OK_AND_ASSIGN(
      Process p,
      launch_process({"sh", "-c", "printf \"$PROCESS_TEST_VAR\""}, &env,
                     ProcessOutConf{.stdout = StreamOutConf::Pipe()}));
  ASSERT_TRUE(wait_for_exit(p));

  EXPECT_EQ(read_fd(p.stdout.fd()), "second");
}

TEST_F(ProcessTest, missing_executable_is_invalid_argument) {
  absl::StatusOr<Process> p =
      launch_process({"/nonexistent/command/that/should/fail"});
  EXPECT_EQ(p.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(ProcessTest, try_wait_reports_exit) {
  ASSERT_OK_AND_ASSIGN(Process p, launch_process({"sh", "-c", "exit 3"}));
  ASSERT_TRUE(wait_for_exit(p));

  ASSERT_TRUE(p.wait_status().has_value());
  EXPECT_TRUE(WIFEXITED(*p.wait_status()));
  EXPECT_EQ(WEXITSTATUS(*p.wait_status()), 3);
  // Repeated calls keep reporting the exit.
  ASSERT_OK_AND_ASSIGN(bool exited, p.try_wait());
  EXPECT_TRUE(exited);
}

TEST_F(ProcessTest, kill_stops_running_process) {
  ASSERT_OK_AND_ASSIGN(Process p, launch_process({"sleep", "30"}));
  ASSERT_OK_AND_ASSIGN(bool exited, p.try_wait());
  ASSERT_FALSE(exited);

  ASSERT_OK(p.kill());

  ASSERT_OK_AND_ASSIGN(exited, p.try_wait());
  EXPECT_TRUE(exited);
  ASSERT_TRUE(p.wait_status().has_value());
  EXPECT_TRUE(WIFSIGNALED(*p.wait_status()));
  EXPECT_EQ(WTERMSIG(*p.wait_status()), SIGKILL);
  // Killing an exited process is a no-op.
  EXPECT_OK(p.kill());
}

TEST_F(ProcessTest, terminate_uses_sigterm_first) {
  ASSERT_OK_AND_ASSIGN(Process p, launch_process({"sleep", "30"}));

  ASSERT_OK(p.terminate(milliseconds(1000)));

  ASSERT_TRUE(p.wait_status().has_value());
  EXPECT_EQ(WTERMSIG(*p.wait_status()), SIGTERM);
}

TEST_F(ProcessTest, child_does_not_inherit_blocked_signals) {
  sigset_t mask, old_mask;
  sigemptyset(&mask);
  sigaddset(&mask, SIGTERM);
  ASSERT_EQ(pthread_sigmask(SIG_BLOCK, &mask, &old_mask), 0);
  absl::StatusOr<Process> p = launch_process({"sleep", "30"});
  ASSERT_EQ(pthread_sigmask(SIG_SETMASK, &old_mask, nullptr), 0);
  ASSERT_OK(p.status());

  ASSERT_OK(p->terminate(milliseconds(1000)));

  ASSERT_TRUE(p->wait_status().has_value());
  EXPECT_EQ(WTERMSIG(*p->wait_status()), SIGTERM);
}

TEST_F(ProcessTest, moved_from_handle_is_empty) {
  ASSERT_OK_AND_ASSIGN(Process p, launch_process({"sleep", "30"}));
  int pid = p.pid;
  Process q = std::move(p);

  EXPECT_EQ(q.pid, pid);
  EXPECT_EQ(p.pid, -1);
  EXPECT_OK(q.kill());
}

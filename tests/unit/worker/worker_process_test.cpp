#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <poll.h>
#include <string>
#include <unistd.h>

#include "../../common/utilities_test.hpp"
#include "harvest_core/worker/worker_process.hpp"

namespace harvest_core {

using harvest_tests::TestUtilities;

namespace {

// Blocking read of everything the child writes to `fd` until EOF.
std::string read_all(int fd) {
  std::string out;
  char buffer[256];
  while (true) {
    pollfd pfd{fd, POLLIN, 0};
    poll(&pfd, 1, 1000);
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out.append(buffer, static_cast<std::size_t>(n));
    } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
      break;
    }
  }
  return out;
}

}  // namespace

TEST(WorkerProcessTest, CapturesStdoutStderrAndExitCode) {
  auto process = WorkerProcess::spawn(
      TestUtilities::shell_worker("echo \"arg=$1\"; echo oops 1>&2; exit 3"), {"payload"});

  EXPECT_EQ(read_all(process->stdout_fd()), "arg=payload\n");
  EXPECT_EQ(read_all(process->stderr_fd()), "oops\n");

  ExitStatus status = process->wait();
  ASSERT_TRUE(status.exit_code.has_value());
  EXPECT_EQ(*status.exit_code, 3);
  EXPECT_FALSE(status.success());
  EXPECT_TRUE(process->has_exited());
  EXPECT_FALSE(process->signal(SIGTERM));
}

TEST(WorkerProcessTest, SignalReportsTermination) {
  auto process = WorkerProcess::spawn(TestUtilities::shell_worker("sleep 10"), {});
  EXPECT_FALSE(process->try_wait().has_value());
  EXPECT_TRUE(process->signal(SIGKILL));

  ExitStatus status = process->wait();
  EXPECT_FALSE(status.exit_code.has_value());
  EXPECT_EQ(status.term_signal.value_or(0), SIGKILL);
  EXPECT_FALSE(status.success());
}

TEST(WorkerProcessTest, PassesEnvironmentAndWorkingDirectory) {
  auto command = TestUtilities::shell_worker("echo \"$HARVEST_PROBE $(pwd)\"");
  command.environment["HARVEST_PROBE"] = "probe-value";
  command.working_directory = "/";
  auto process = WorkerProcess::spawn(command, {});

  EXPECT_EQ(read_all(process->stdout_fd()), "probe-value /\n");
  EXPECT_TRUE(process->wait().success());
}

TEST(WorkerProcessTest, MissingExecutableThrows) {
  WorkerCommand command;
  command.executable = "harvest-worker-that-does-not-exist";
  EXPECT_THROW(WorkerProcess::spawn(command, {}), WorkerProcessError);
}

TEST(WorkerProcessTest, BadWorkingDirectoryThrows) {
  auto command = TestUtilities::shell_worker("exit 0");
  command.working_directory = "/nonexistent/harvest/dir";
  EXPECT_THROW(WorkerProcess::spawn(command, {}), WorkerProcessError);
}

TEST(WorkerProcessTest, ResolveExecutableSearchesPath) {
  auto sh = resolve_executable("sh");
  ASSERT_TRUE(sh.has_value());
  EXPECT_EQ(access(sh->c_str(), X_OK), 0);
  EXPECT_EQ(resolve_executable("/bin/sh").value_or(""), "/bin/sh");
  EXPECT_FALSE(resolve_executable("").has_value());
}

}  // namespace harvest_core

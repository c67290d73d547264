#include "harvest_core/worker/worker_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace harvest_core {

namespace {

void close_fd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void set_non_blocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

bool make_pipe(int fds[2]) {
  return pipe2(fds, O_CLOEXEC) == 0;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string item(*entry);
    auto eq = item.find('=');
    std::string key = eq == std::string::npos ? item : item.substr(0, eq);
    if (overrides.count(key) == 0) {
      env.push_back(std::move(item));
    }
  }
  for (const auto& [key, value] : overrides) {
    env.push_back(key + "=" + value);
  }
  return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& items) {
  std::vector<char*> out;
  out.reserve(items.size() + 1);
  for (auto& item : items) {
    out.push_back(item.data());
  }
  out.push_back(nullptr);
  return out;
}

// Only async-signal-safe calls from here on; we are in the forked child.
[[noreturn]] void child_fail(int status_fd, int err) {
  ssize_t written = write(status_fd, &err, sizeof(err));
  (void)written;
  _exit(127);
}

}  // namespace

ExitStatus ExitStatus::from_wait_status(int status) {
  ExitStatus result;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

std::optional<std::string> resolve_executable(const std::string& name) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (access(name.c_str(), X_OK) == 0) {
      return name;
    }
    return std::nullopt;
  }
  const char* path_env = std::getenv("PATH");
  std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  std::stringstream ss(path);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    std::string candidate = dir + "/" + name;
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

WorkerProcess::WorkerProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

std::unique_ptr<WorkerProcess> WorkerProcess::spawn(const WorkerCommand& command,
                                                    const std::vector<std::string>& extra_args) {
  auto resolved = resolve_executable(command.executable);
  if (!resolved) {
    throw WorkerProcessError("Worker executable not found: " + command.executable);
  }

  // Everything the child needs is built before fork.
  std::vector<std::string> argv_storage;
  argv_storage.push_back(command.executable);
  argv_storage.insert(argv_storage.end(), command.args.begin(), command.args.end());
  argv_storage.insert(argv_storage.end(), extra_args.begin(), extra_args.end());
  std::vector<std::string> env_storage = build_environment(command.environment);
  std::vector<char*> argv = to_c_array(argv_storage);
  std::vector<char*> envp = to_c_array(env_storage);
  const std::string exe_path = *resolved;
  const std::string& cwd = command.working_directory;

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(status_pipe)) {
    int err = errno;
    for (int* fds : {out_pipe, err_pipe, status_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    throw WorkerProcessError(std::string("Failed to create pipe: ") + std::strerror(err));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    for (int* fds : {out_pipe, err_pipe, status_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    throw WorkerProcessError(std::string("Failed to fork: ") + std::strerror(err));
  }

  if (pid == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 ||
        dup2(out_pipe[1], STDOUT_FILENO) < 0 || dup2(err_pipe[1], STDERR_FILENO) < 0) {
      child_fail(status_pipe[1], errno);
    }
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      child_fail(status_pipe[1], errno);
    }
    // Restore default dispositions the parent may have changed.
    std::signal(SIGPIPE, SIG_DFL);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    execve(exe_path.c_str(), argv.data(), envp.data());
    child_fail(status_pipe[1], errno);
  }

  setpgid(pid, pid);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  // The status pipe is close-on-exec: EOF means exec succeeded, data is errno.
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (n > 0) {
    int status = 0;
    waitpid(pid, &status, 0);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    throw WorkerProcessError("Failed to start worker '" + command.executable +
                             "': " + std::strerror(child_errno));
  }

  set_non_blocking(out_pipe[0]);
  set_non_blocking(err_pipe[0]);
  return std::unique_ptr<WorkerProcess>(new WorkerProcess(pid, out_pipe[0], err_pipe[0]));
}

WorkerProcess::~WorkerProcess() {
  close_stdout();
  close_stderr();
  if (!exit_status_) {
    signal(SIGKILL);
    wait();
  }
}

void WorkerProcess::close_stdout() {
  close_fd(stdout_fd_);
}

void WorkerProcess::close_stderr() {
  close_fd(stderr_fd_);
}

bool WorkerProcess::signal(int sig) {
  if (exit_status_) {
    return false;
  }
  if (kill(-pid_, sig) == 0) {
    return true;
  }
  // The group may not exist yet if the child has not run setpgid.
  return kill(pid_, sig) == 0;
}

std::optional<ExitStatus> WorkerProcess::try_wait() {
  if (exit_status_) {
    return exit_status_;
  }
  int status = 0;
  const pid_t done = waitpid(pid_, &status, WNOHANG);
  if (done == pid_) {
    exit_status_ = ExitStatus::from_wait_status(status);
  } else if (done < 0 && errno == ECHILD) {
    exit_status_ = ExitStatus{};
  }
  return exit_status_;
}

ExitStatus WorkerProcess::wait() {
  if (exit_status_) {
    return *exit_status_;
  }
  int status = 0;
  pid_t done;
  do {
    done = waitpid(pid_, &status, 0);
  } while (done < 0 && errno == EINTR);
  exit_status_ = done == pid_ ? ExitStatus::from_wait_status(status) : ExitStatus{};
  return *exit_status_;
}

}  // namespace harvest_core

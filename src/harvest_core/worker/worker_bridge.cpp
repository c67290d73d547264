#include "harvest_core/worker/worker_bridge.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>

#include "harvest_core/db/task_store.hpp"
#include "harvest_core/worker/line_framer.hpp"

namespace harvest_core {

namespace {

constexpr int kPollIntervalMs = 50;
constexpr std::chrono::milliseconds kReapInterval(20);

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto start = s.find_first_not_of(ws);
  if (start == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

std::string describe_abnormal_exit(const ExitStatus& status) {
  if (status.exit_code) {
    return "Process exited with code " + std::to_string(*status.exit_code);
  }
  if (status.term_signal) {
    return "Process terminated by signal " + std::to_string(*status.term_signal);
  }
  return "Process exit status unavailable";
}

// Markers the collection API puts in api_message when it flags the account.
const char* const kAccountAnomalyMarkers[] = {"\u8d26\u53f7\u5f02\u5e38", "code=-1"};

bool reports_account_anomaly(const std::string& api_message) {
  for (const char* marker : kAccountAnomalyMarkers) {
    if (api_message.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

enum class ReadResult { WouldBlock, Closed };

// Reads everything currently available on a non-blocking fd.
template <typename Sink>
ReadResult read_available(int fd, Sink&& sink) {
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t bytes = read(fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      sink(buffer.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return ReadResult::WouldBlock;
    }
    return ReadResult::Closed;
  }
}

void poll_open_fds(const WorkerProcess& process) {
  std::array<pollfd, 2> fds{};
  nfds_t count = 0;
  for (int fd : {process.stdout_fd(), process.stderr_fd()}) {
    if (fd >= 0) {
      fds[count].fd = fd;
      fds[count].events = POLLIN;
      ++count;
    }
  }
  if (poll(fds.data(), count, kPollIntervalMs) < 0 && errno != EINTR) {
    std::cerr << "WorkerBridge: poll failed: " << std::strerror(errno) << std::endl;
  }
}

}  // namespace

struct WorkerBridge::Session {
  long long task_id = 0;
  std::unique_ptr<WorkerProcess> process;
  EventChannelPtr channel;
  std::thread thread;

  // Guarded by WorkerBridge::mutex_.
  bool detached = false;
  bool killed = false;
  std::chrono::steady_clock::time_point kill_deadline;
  std::optional<std::string> last_error;
  std::optional<WorkerEvent> done;

  std::atomic<bool> finished{false};
};

nlohmann::json ValidationResult::to_json() const {
  nlohmann::json json = {{"valid", valid}, {"message", message}};
  if (user_info) {
    json["userInfo"] = {{"userId", user_info->user_id},
                        {"nickname", user_info->nickname},
                        {"redId", user_info->red_id},
                        {"avatar", user_info->avatar}};
  }
  return json;
}

WorkerBridge::WorkerBridge(TaskStore& store, WorkerCommand command)
    : store_(store), command_(std::move(command)) {}

WorkerBridge::~WorkerBridge() {
  shutdown();
}

long long WorkerBridge::start(const JobDescription& job, EventChannelPtr channel) {
  if (!channel) {
    throw std::invalid_argument("WorkerBridge::start requires an event channel");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_) {
    throw WorkerBridgeError(ErrorKind::AlreadyRunning, "A task is already running");
  }
  join_finished_sessions();

  // The task exists before the worker can print anything.
  const long long task_id = store_.create_task(job.kind, job.params, job.config_snapshot());

  std::unique_ptr<WorkerProcess> process;
  try {
    process = WorkerProcess::spawn(command_, {job.to_worker_argument()});
  } catch (const WorkerProcessError& e) {
    std::cerr << "WorkerBridge: " << e.what() << std::endl;
    channel->close();
    const std::string message = to_valid_utf8(e.what());
    store_.update_task(task_id, TaskStatus::FAILED, message);
    store_.add_log(task_id,
                   WorkerEvent::make_error(message, to_string(ErrorKind::ProcessSpawnError)));
    throw WorkerBridgeError(ErrorKind::ProcessSpawnError, message, task_id);
  }

  auto session = std::make_shared<Session>();
  session->task_id = task_id;
  session->process = std::move(process);
  session->channel = std::move(channel);
  std::cout << "WorkerBridge: started worker pid " << session->process->pid() << " for task "
            << task_id << " (" << job.kind << ")" << std::endl;

  active_ = session;
  sessions_.push_back(session);
  session->thread = std::thread(&WorkerBridge::supervise, this, session);
  return task_id;
}

void WorkerBridge::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  stop_locked();
}

void WorkerBridge::stop_locked() {
  if (!active_) {
    return;
  }
  std::shared_ptr<Session> session = std::move(active_);
  active_.reset();

  session->process->signal(SIGTERM);
  session->detached = true;
  session->kill_deadline = std::chrono::steady_clock::now() + command_.stop_grace_period;
  session->channel->close();
  std::cout << "WorkerBridge: sent SIGTERM to worker for task " << session->task_id
            << std::endl;

  store_.update_task(session->task_id, TaskStatus::STOPPED);
  store_.add_log(session->task_id, WorkerEvent::make_log("warning", "Task stopped"));
}

bool WorkerBridge::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ != nullptr;
}

std::optional<long long> WorkerBridge::current_task_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!active_) {
    return std::nullopt;
  }
  return active_->task_id;
}

void WorkerBridge::shutdown() {
  std::vector<std::shared_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
      stop_locked();
    } catch (const HarvestError& e) {
      std::cerr << "WorkerBridge: failed to record stop during shutdown: " << e.what()
                << std::endl;
    }
    sessions.swap(sessions_);
  }
  for (auto& session : sessions) {
    if (session->thread.joinable()) {
      session->thread.join();
    }
  }
}

void WorkerBridge::join_finished_sessions() {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if ((*it)->finished.load()) {
      if ((*it)->thread.joinable()) {
        (*it)->thread.join();
      }
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

// ============================================================================
// Supervisor
// ============================================================================

void WorkerBridge::supervise(std::shared_ptr<Session> session) {
  WorkerProcess& process = *session->process;
  LineFramer out_framer;
  LineFramer err_framer;

  auto on_stdout = [&](const char* data, std::size_t size) {
    for (const auto& frame : out_framer.feed(data, size)) {
      handle_stdout_frame(*session, frame);
    }
  };
  auto on_stderr = [&](const char* data, std::size_t size) {
    for (const auto& line : err_framer.feed(data, size)) {
      handle_stderr_line(*session, line);
    }
  };
  auto drain = [&]() {
    if (process.stdout_fd() >= 0 &&
        read_available(process.stdout_fd(), on_stdout) == ReadResult::Closed) {
      process.close_stdout();
    }
    if (process.stderr_fd() >= 0 &&
        read_available(process.stderr_fd(), on_stderr) == ReadResult::Closed) {
      process.close_stderr();
    }
  };
  auto escalate_if_due = [&]() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session->detached && !session->killed &&
        std::chrono::steady_clock::now() >= session->kill_deadline) {
      session->killed = true;
      if (process.signal(SIGKILL)) {
        std::cerr << "WorkerBridge: worker for task " << session->task_id
                  << " ignored SIGTERM, sent SIGKILL" << std::endl;
      }
    }
  };

  std::optional<ExitStatus> status;
  while (process.stdout_fd() >= 0 || process.stderr_fd() >= 0) {
    poll_open_fds(process);
    drain();
    escalate_if_due();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      status = process.try_wait();
    }
    if (status) {
      // Anything written before exit is already in the pipes. Descendants
      // holding the write ends open must not keep the run alive.
      drain();
      break;
    }
  }

  if (auto tail = out_framer.finish()) {
    std::cerr << "WorkerBridge: rejecting unterminated frame from task " << session->task_id
              << ": " << *tail << std::endl;
  }
  if (auto tail = err_framer.finish()) {
    handle_stderr_line(*session, *tail);
  }
  if (out_framer.dropped_frames() > 0) {
    std::cerr << "WorkerBridge: dropped " << out_framer.dropped_frames()
              << " oversized frame(s) from task " << session->task_id << std::endl;
  }
  process.close_stdout();
  process.close_stderr();

  while (!status) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      status = process.try_wait();
    }
    if (!status) {
      escalate_if_due();
      std::this_thread::sleep_for(kReapInterval);
    }
  }

  finalize(*session, *status);
  session->finished.store(true);
}

void WorkerBridge::handle_stdout_frame(Session& session, const std::string& frame) {
  WorkerEvent event;
  try {
    event = WorkerEvent::parse_line(frame);
  } catch (const WorkerProtocolError& e) {
    std::cerr << "WorkerBridge: dropping frame from task " << session.task_id << " ("
              << e.what() << "): " << frame << std::endl;
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (session.detached) {
    return;
  }
  if (event.type == WorkerEventType::Error) {
    session.last_error = event.message;
  } else if (event.type == WorkerEventType::Done) {
    session.done = event;
  }
  emit_locked(session, event);
}

void WorkerBridge::handle_stderr_line(Session& session, const std::string& line) {
  std::string text = to_valid_utf8(trim(line));
  if (text.empty()) {
    return;
  }
  std::cerr << "[worker stderr] " << text << std::endl;

  std::lock_guard<std::mutex> lock(mutex_);
  if (session.detached) {
    return;
  }
  session.last_error = text;
  emit_locked(session, WorkerEvent::make_error(text, "stderr"));
}

void WorkerBridge::emit_locked(Session& session, const WorkerEvent& event) {
  try {
    store_.add_log(session.task_id, event);
  } catch (const TaskStoreError& e) {
    std::cerr << "WorkerBridge: failed to store log for task " << session.task_id << ": "
              << e.what() << std::endl;
  }
  session.channel->push(event);
}

void WorkerBridge::finalize(Session& session, const ExitStatus& status) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (session.detached) {
    std::cout << "WorkerBridge: stopped worker for task " << session.task_id << " reaped ("
              << describe_abnormal_exit(status) << ")" << std::endl;
    return;
  }

  TaskStatus task_status = TaskStatus::COMPLETED;
  std::optional<std::string> message;
  std::optional<long long> result_count;
  std::optional<std::string> error_code;

  if (session.last_error) {
    task_status = TaskStatus::FAILED;
    message = session.last_error;
  } else if (!status.success()) {
    task_status = TaskStatus::FAILED;
    message = describe_abnormal_exit(status);
    error_code = to_string(ErrorKind::ProcessExitError);
  } else if (session.done) {
    const WorkerEvent& done = *session.done;
    const std::string api_message = done.api_message.value_or("");
    result_count = done.count.value_or(0);
    if ((done.api_success && !*done.api_success) || reports_account_anomaly(api_message)) {
      task_status = TaskStatus::FAILED;
      message = api_message.empty() ? std::string("worker reported an API failure") : api_message;
      error_code = "account_anomaly";
    } else if (*result_count == 0) {
      task_status = TaskStatus::WARNING;
      message = "completed without collecting any records";
    }
  }

  WorkerEvent exit_event;
  exit_event.type = WorkerEventType::Exit;
  exit_event.exit_code = status.exit_code;
  exit_event.success = task_status != TaskStatus::FAILED;
  exit_event.outcome = to_string(task_status);
  exit_event.message = message.value_or("");
  exit_event.code = error_code;

  try {
    store_.update_task(session.task_id, task_status, message, result_count);
    store_.add_log(session.task_id, exit_event);
  } catch (const TaskStoreError& e) {
    std::cerr << "WorkerBridge: failed to finalize task " << session.task_id << ": "
              << e.what() << std::endl;
  }
  std::cout << "WorkerBridge: task " << session.task_id << " finished as "
            << to_string(task_status) << std::endl;

  if (active_.get() == &session) {
    active_.reset();
  }
  session.channel->push(exit_event);
  session.channel->close();
}

// ============================================================================
// Validation
// ============================================================================

ValidationResult WorkerBridge::validate(const nlohmann::json& payload) {
  std::unique_ptr<WorkerProcess> process;
  try {
    process = WorkerProcess::spawn(command_, {"validate", payload.dump()});
  } catch (const WorkerProcessError& e) {
    throw WorkerBridgeError(ErrorKind::ProcessSpawnError, e.what());
  }

  std::string out;
  std::string err;
  auto append_out = [&](const char* data, std::size_t size) { out.append(data, size); };
  auto append_err = [&](const char* data, std::size_t size) { err.append(data, size); };
  auto drain = [&]() {
    if (process->stdout_fd() >= 0 &&
        read_available(process->stdout_fd(), append_out) == ReadResult::Closed) {
      process->close_stdout();
    }
    if (process->stderr_fd() >= 0 &&
        read_available(process->stderr_fd(), append_err) == ReadResult::Closed) {
      process->close_stderr();
    }
  };

  const auto deadline = std::chrono::steady_clock::now() + command_.validation_timeout;
  std::optional<ExitStatus> status;
  while (!status) {
    if (std::chrono::steady_clock::now() > deadline) {
      process->signal(SIGKILL);
      process->wait();
      std::cerr << "WorkerBridge: validation timed out" << std::endl;
      return ValidationResult{false,
                              "Validation timed out after " +
                                  std::to_string(command_.validation_timeout.count()) +
                                  " seconds",
                              std::nullopt};
    }
    poll_open_fds(*process);
    drain();
    status = process->try_wait();
  }
  drain();

  LineFramer framer;
  std::vector<std::string> lines = framer.feed(out);
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    WorkerEvent event;
    try {
      event = WorkerEvent::parse_line(*it);
    } catch (const WorkerProtocolError&) {
      continue;
    }
    if (event.type == WorkerEventType::ValidationResult) {
      ValidationResult result;
      result.valid = event.valid.value_or(false) && status->success();
      result.message = event.message;
      result.user_info = event.user_info;
      if (!status->success() && result.message.empty()) {
        result.message = describe_abnormal_exit(*status);
      }
      return result;
    }
    if (event.type == WorkerEventType::Error) {
      return ValidationResult{false, event.message, std::nullopt};
    }
  }

  std::string stderr_text = to_valid_utf8(trim(err));
  return ValidationResult{false, stderr_text.empty() ? "Unknown validation error" : stderr_text,
                          std::nullopt};
}

}  // namespace harvest_core

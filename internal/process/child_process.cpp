#include "child_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include "internal/util/errors.hpp"

extern char** environ;

namespace bolt::process {

namespace {

void CloseFd(int fd) {
  if (fd >= 0) {
    ::close(fd);
  }
}

std::string ErrnoMessage(const std::string& action, int err) {
  return action + ": " + std::strerror(err);
}

bool IsExecutable(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::filesystem::path> ResolveExecutable(const std::string& binary) {
  if (binary.empty()) {
    return std::nullopt;
  }

  if (binary.find('/') != std::string::npos) {
    if (IsExecutable(binary)) {
      return std::filesystem::path(binary);
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return std::nullopt;
  }

  std::stringstream entries(path_env);
  std::string       dir;
  while (std::getline(entries, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    auto candidate = std::filesystem::path(dir) / binary;
    if (IsExecutable(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const LaunchSpec& spec, LineHandler on_line, ExitHandler on_exit) {
  const auto executable = ResolveExecutable(spec.binary);
  if (!executable.has_value()) {
    throw util::SpawnError("executable not found or not executable: " + spec.binary);
  }

  if (!spec.working_dir.empty()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(spec.working_dir, ec)) {
      throw util::SpawnError("working directory is not usable: " + spec.working_dir.string());
    }
  }

  // argv is built before fork; the child only makes async-signal-safe calls.
  const std::string  exec_path = executable->string();
  std::vector<char*> argv;
  argv.reserve(spec.args.size() + 2);
  argv.push_back(const_cast<char*>(exec_path.c_str()));
  for (const auto& arg : spec.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const std::string working_dir = spec.working_dir.string();

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int error_pipe[2]  = {-1, -1};
  if (::pipe2(stdout_pipe, O_CLOEXEC) != 0 || ::pipe2(stderr_pipe, O_CLOEXEC) != 0 || ::pipe2(error_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1], error_pipe[0], error_pipe[1]}) {
      CloseFd(fd);
    }
    throw util::SpawnError(ErrnoMessage("pipe failed", err));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1], error_pipe[0], error_pipe[1]}) {
      CloseFd(fd);
    }
    throw util::SpawnError(ErrnoMessage("fork failed", err));
  }

  if (pid == 0) {
    ::setpgid(0, 0);

    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    ::dup2(stdout_pipe[1], STDOUT_FILENO);
    ::dup2(stderr_pipe[1], STDERR_FILENO);

    int err = 0;
    if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
      err = errno;
    } else {
      ::execve(exec_path.c_str(), argv.data(), environ);
      err = errno;
    }
    [[maybe_unused]] auto written = ::write(error_pipe[1], &err, sizeof(err));
    ::_exit(127);
  }

  // Also set from the parent so Signal() cannot race the child's setpgid.
  ::setpgid(pid, pid);

  CloseFd(stdout_pipe[1]);
  CloseFd(stderr_pipe[1]);
  CloseFd(error_pipe[1]);

  int     child_errno = 0;
  ssize_t n           = 0;
  do {
    n = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(error_pipe[0]);

  if (n > 0) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    CloseFd(stdout_pipe[0]);
    CloseFd(stderr_pipe[0]);
    throw util::SpawnError(ErrnoMessage("failed to start " + exec_path, child_errno));
  }

  return std::unique_ptr<ChildProcess>(
      new ChildProcess(pid, stdout_pipe[0], stderr_pipe[0], std::move(on_line), std::move(on_exit)));
}

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd, LineHandler on_line, ExitHandler on_exit)
    : pid_(pid), on_line_(std::move(on_line)), on_exit_(std::move(on_exit)) {
  stdout_reader_ = std::thread([this, stdout_fd] { ReadLines(stdout_fd); });
  stderr_reader_ = std::thread([this, stderr_fd] { ReadLines(stderr_fd); });
  reaper_        = std::thread([this] { Reap(); });
}

ChildProcess::~ChildProcess() {
  if (Running()) {
    Signal(SIGKILL);
  }
  if (reaper_.joinable()) {
    reaper_.join();
  }
}

bool ChildProcess::Running() const {
  std::lock_guard lock(mutex_);
  return !exit_status_.has_value();
}

bool ChildProcess::Signal(int signal) {
  std::lock_guard lock(mutex_);
  if (exit_status_.has_value()) {
    return false;
  }
  return ::kill(-pid_, signal) == 0 || ::kill(pid_, signal) == 0;
}

std::optional<ExitStatus> ChildProcess::WaitForExit(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  exited_cv_.wait_for(lock, timeout, [&] { return exit_status_.has_value(); });
  return exit_status_;
}

void ChildProcess::ReadLines(int fd) {
  std::string pending;
  char        buffer[4096];

  while (true) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }

    pending.append(buffer, static_cast<std::size_t>(n));

    std::size_t start = 0;
    std::size_t newline;
    while ((newline = pending.find('\n', start)) != std::string::npos) {
      if (on_line_) {
        on_line_(pending.substr(start, newline - start));
      }
      start = newline + 1;
    }
    pending.erase(0, start);
  }

  if (!pending.empty() && on_line_) {
    on_line_(pending);
  }
  ::close(fd);
}

void ChildProcess::Reap() {
  // Wait without reaping so the pid stays valid for Signal() until the exit
  // is recorded under the lock.
  siginfo_t info{};
  int       result = 0;
  do {
    result = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
  } while (result < 0 && errno == EINTR);

  ExitStatus exit_status;
  if (result == 0) {
    if (info.si_code == CLD_EXITED) {
      exit_status.code = info.si_status;
    } else {
      exit_status.signal = info.si_status;
    }
  }

  {
    std::lock_guard lock(mutex_);
    int status = 0;
    ::waitpid(pid_, &status, 0);
    exit_status_ = exit_status;
  }
  exited_cv_.notify_all();

  if (stdout_reader_.joinable()) {
    stdout_reader_.join();
  }
  if (stderr_reader_.joinable()) {
    stderr_reader_.join();
  }

  if (on_exit_) {
    on_exit_(exit_status);
  }
}

} // namespace bolt::process

#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace bolt::process {

struct LaunchSpec {
  std::string              binary;  // absolute, relative or resolved through PATH
  std::vector<std::string> args;
  std::filesystem::path    working_dir;
};

struct ExitStatus {
  int code   = -1;  // -1 when terminated by a signal
  int signal = 0;
};

/*
  A spawned child with its stdout/stderr read line by line.

  The child runs in its own process group; Signal() targets the whole group.
  OnLine is called from reader threads. OnExit is called once from the
  reaper thread after all output has been delivered.
*/
class ChildProcess {
 public:
  using LineHandler = std::function<void(const std::string& line)>;
  using ExitHandler = std::function<void(const ExitStatus& status)>;

  // Throws SpawnError when the binary or working directory is unusable, or
  // when fork/exec fails.
  static std::unique_ptr<ChildProcess> Spawn(const LaunchSpec& spec, LineHandler on_line, ExitHandler on_exit);

  ~ChildProcess();

  ChildProcess(const ChildProcess&)            = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t Pid() const {
    return pid_;
  }

  bool Running() const;

  // false if the process already exited.
  bool Signal(int signal);

  // Exit status, or nullopt if the child is still running after `timeout`.
  // Returns as soon as the child exits.
  std::optional<ExitStatus> WaitForExit(std::chrono::milliseconds timeout);

 private:
  ChildProcess(pid_t pid, int stdout_fd, int stderr_fd, LineHandler on_line, ExitHandler on_exit);

  void ReadLines(int fd);
  void Reap();

  pid_t       pid_;
  LineHandler on_line_;
  ExitHandler on_exit_;

  mutable std::mutex        mutex_;
  std::condition_variable   exited_cv_;
  std::optional<ExitStatus> exit_status_;

  std::thread stdout_reader_;
  std::thread stderr_reader_;
  std::thread reaper_;
};

// Resolves `binary` against PATH when it contains no '/'.
std::optional<std::filesystem::path> ResolveExecutable(const std::string& binary);

} // namespace bolt::process

#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <sys/types.h>

#include "lsp/error.hpp"

namespace codenav::client {

// How to launch a language server: executable (looked up on PATH), its
// arguments and the working directory of the child.
struct LaunchDescriptor {
  std::string command;
  std::vector<std::string> args;
  std::filesystem::path working_directory;
};

// A spawned child with its stdin, stdout and stderr connected to pipes.
//
// The destructor kills and reaps a child that is still running, so a
// ChildProcess never leaves a zombie or an orphaned server behind.
class ChildProcess {
 public:
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess(ChildProcess&&) = delete;
  auto operator=(const ChildProcess&) -> ChildProcess& = delete;
  auto operator=(ChildProcess&&) -> ChildProcess& = delete;
  ~ChildProcess();

  // Forks and execs the descriptor. Fails with kStartupFailed when the pipes
  // cannot be created, fork fails, or exec fails in the child (for example
  // command not found).
  static auto Spawn(
      asio::any_io_executor executor, const LaunchDescriptor& descriptor)
      -> std::expected<std::unique_ptr<ChildProcess>, lsp::error::LspError>;

  [[nodiscard]] auto Pid() const -> pid_t {
    return pid_;
  }

  auto Stdin() -> asio::posix::stream_descriptor& {
    return stdin_;
  }
  auto Stdout() -> asio::posix::stream_descriptor& {
    return stdout_;
  }
  auto Stderr() -> asio::posix::stream_descriptor& {
    return stderr_;
  }

  // Closes all three pipes, pending reads complete with an error
  auto ClosePipes() -> void;

  // Non-blocking reap; true once the child has exited
  auto HasExited() -> bool;

  // Raw wait status once reaped
  [[nodiscard]] auto ExitStatus() const -> std::optional<int> {
    return exit_status_;
  }

  auto Signal(int signal) -> void;

  // Polls until the child exits or the timeout passes; true when exited
  auto WaitForExit(std::chrono::milliseconds timeout) -> asio::awaitable<bool>;

  // SIGTERM, wait `grace`, SIGKILL, reap
  auto Terminate(std::chrono::milliseconds grace) -> asio::awaitable<void>;

  // SIGKILL and reap, blocking until the child is gone
  auto Kill() -> void;

 private:
  ChildProcess(
      asio::any_io_executor executor, pid_t pid, int stdin_fd, int stdout_fd,
      int stderr_fd);

  asio::any_io_executor executor_;
  pid_t pid_;
  asio::posix::stream_descriptor stdin_;
  asio::posix::stream_descriptor stdout_;
  asio::posix::stream_descriptor stderr_;
  std::optional<int> exit_status_;
};

// Human readable description of a wait status ("exit code 1", "signal 9")
auto DescribeExitStatus(int status) -> std::string;

}  // namespace codenav::client

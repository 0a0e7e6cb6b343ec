#include "codenav/client/child_process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <utility>

#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <fcntl.h>
#include <fmt/format.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codenav::client {

namespace {

constexpr auto kExitPollInterval = std::chrono::milliseconds(20);

// Writes to a pipe whose reader died must fail with EPIPE instead of
// terminating codenav
void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

struct Pipe {
  std::array<int, 2> fds{-1, -1};

  Pipe() = default;
  Pipe(const Pipe&) = delete;
  Pipe(Pipe&&) = delete;
  auto operator=(const Pipe&) -> Pipe& = delete;
  auto operator=(Pipe&&) -> Pipe& = delete;
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  auto Open() -> bool {
    return ::pipe2(fds.data(), O_CLOEXEC) == 0;
  }
  auto ReleaseRead() -> int {
    return std::exchange(fds[0], -1);
  }
  auto ReleaseWrite() -> int {
    return std::exchange(fds[1], -1);
  }
  void CloseRead() {
    if (fds[0] >= 0) {
      ::close(std::exchange(fds[0], -1));
    }
  }
  void CloseWrite() {
    if (fds[1] >= 0) {
      ::close(std::exchange(fds[1], -1));
    }
  }
};

auto StartupError(const std::string& message) -> lsp::error::LspError {
  return lsp::error::LspError::FromCode(
      lsp::error::LspErrorCode::kStartupFailed, message);
}

// Runs in the forked child; never returns
[[noreturn]] void ExecChild(
    const LaunchDescriptor& descriptor, Pipe& in, Pipe& out, Pipe& err,
    Pipe& status) {
  std::signal(SIGPIPE, SIG_DFL);

  ::dup2(in.fds[0], STDIN_FILENO);
  ::dup2(out.fds[1], STDOUT_FILENO);
  ::dup2(err.fds[1], STDERR_FILENO);

  auto report_and_exit = [&status]() {
    int error = errno;
    [[maybe_unused]] auto written =
        ::write(status.fds[1], &error, sizeof(error));
    ::_exit(127);
  };

  if (!descriptor.working_directory.empty() &&
      ::chdir(descriptor.working_directory.c_str()) != 0) {
    report_and_exit();
  }

  std::vector<char*> argv;
  argv.reserve(descriptor.args.size() + 2);
  argv.push_back(const_cast<char*>(descriptor.command.c_str()));
  for (const auto& arg : descriptor.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  ::execvp(descriptor.command.c_str(), argv.data());
  report_and_exit();
  ::_exit(127);
}

}  // namespace

ChildProcess::ChildProcess(
    asio::any_io_executor executor, pid_t pid, int stdin_fd, int stdout_fd,
    int stderr_fd)
    : executor_(executor),
      pid_(pid),
      stdin_(executor, stdin_fd),
      stdout_(executor, stdout_fd),
      stderr_(executor, stderr_fd) {
}

ChildProcess::~ChildProcess() {
  ClosePipes();
  Kill();
}

auto ChildProcess::Spawn(
    asio::any_io_executor executor, const LaunchDescriptor& descriptor)
    -> std::expected<std::unique_ptr<ChildProcess>, lsp::error::LspError> {
  IgnoreSigpipeOnce();

  if (descriptor.command.empty()) {
    return std::unexpected(StartupError("Empty launch command"));
  }

  Pipe in;
  Pipe out;
  Pipe err;
  Pipe status;
  if (!in.Open() || !out.Open() || !err.Open() || !status.Open()) {
    return std::unexpected(StartupError(
        fmt::format("Failed to create pipes: {}", std::strerror(errno))));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    return std::unexpected(
        StartupError(fmt::format("fork failed: {}", std::strerror(errno))));
  }
  if (pid == 0) {
    ExecChild(descriptor, in, out, err, status);
  }

  in.CloseRead();
  out.CloseWrite();
  err.CloseWrite();
  status.CloseWrite();

  // The status pipe is close-on-exec: EOF means exec succeeded, an int means
  // the child reported errno before exiting
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status.fds[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int wait_status = 0;
    ::waitpid(pid, &wait_status, 0);
    return std::unexpected(StartupError(fmt::format(
        "Failed to launch '{}': {}", descriptor.command,
        std::strerror(child_errno))));
  }

  return std::unique_ptr<ChildProcess>(new ChildProcess(
      executor, pid, in.ReleaseWrite(), out.ReleaseRead(), err.ReleaseRead()));
}

auto ChildProcess::ClosePipes() -> void {
  std::error_code ec;
  if (stdin_.is_open()) {
    stdin_.close(ec);
  }
  if (stdout_.is_open()) {
    stdout_.close(ec);
  }
  if (stderr_.is_open()) {
    stderr_.close(ec);
  }
}

auto ChildProcess::HasExited() -> bool {
  if (exit_status_) {
    return true;
  }
  int status = 0;
  const pid_t result = ::waitpid(pid_, &status, WNOHANG);
  if (result == pid_) {
    exit_status_ = status;
    return true;
  }
  if (result < 0 && errno == ECHILD) {
    // Reaped elsewhere, nothing left to wait for
    exit_status_ = 0;
    return true;
  }
  return false;
}

auto ChildProcess::Signal(int signal) -> void {
  if (!HasExited()) {
    ::kill(pid_, signal);
  }
}

auto ChildProcess::WaitForExit(std::chrono::milliseconds timeout)
    -> asio::awaitable<bool> {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  asio::steady_timer timer(executor_);
  while (!HasExited()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      co_return false;
    }
    timer.expires_after(kExitPollInterval);
    std::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
  }
  co_return true;
}

auto ChildProcess::Terminate(std::chrono::milliseconds grace)
    -> asio::awaitable<void> {
  if (HasExited()) {
    co_return;
  }
  Signal(SIGTERM);
  if (co_await WaitForExit(grace)) {
    co_return;
  }
  Kill();
}

auto ChildProcess::Kill() -> void {
  if (HasExited()) {
    return;
  }
  ::kill(pid_, SIGKILL);
  int status = 0;
  pid_t result = 0;
  do {
    result = ::waitpid(pid_, &status, 0);
  } while (result < 0 && errno == EINTR);
  exit_status_ = status;
}

auto DescribeExitStatus(int status) -> std::string {
  if (WIFEXITED(status)) {
    return fmt::format("exit code {}", WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return fmt::format("signal {}", WTERMSIG(status));
  }
  return fmt::format("status {}", status);
}

}  // namespace codenav::client

#include "app/crash_handler.hpp"

#include <cstdlib>

#ifdef __linux__
#include <array>
#include <csignal>
#include <exception>
#include <iostream>
#include <stacktrace>
#include <unistd.h>
#endif

namespace app {

#ifdef __linux__
namespace {

constexpr std::array kFatalSignals = {SIGSEGV, SIGFPE, SIGILL, SIGBUS, SIGABRT};

void HandleFatalSignal(int sig) noexcept {
  std::signal(sig, SIG_DFL);

  // stdout belongs to the MCP stream
  std::cerr << "\ncodenav: fatal signal " << sig << "\nStack trace:\n";
  try {
    std::cerr << std::stacktrace::current() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "(stack trace unavailable: " << e.what() << ")\n";
  }
  std::cerr.flush();

  ::raise(sig);
}

}  // namespace
#endif

void InitializeCrashHandlers() {
#ifdef __linux__
  for (int sig : kFatalSignals) {
    std::signal(sig, HandleFatalSignal);
  }
#endif
}

void WaitForDebuggerIfRequested() {
#ifdef __linux__
  if (std::getenv("WAIT_FOR_GDB") != nullptr) {
    std::raise(SIGSTOP);
  }
#endif
}

}  // namespace app

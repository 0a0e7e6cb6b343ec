#pragma once

namespace app {

/// Installs handlers for SIGSEGV, SIGFPE, SIGILL, SIGBUS and SIGABRT that
/// print a stack trace to stderr and re-raise the signal
void InitializeCrashHandlers();

/// Raises SIGSTOP when WAIT_FOR_GDB is set so a debugger can attach before
/// the session starts
void WaitForDebuggerIfRequested();

}  // namespace app

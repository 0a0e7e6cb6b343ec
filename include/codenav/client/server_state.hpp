#pragma once

#include <string_view>

#include <fmt/format.h>

namespace codenav::client {

// Lifecycle of a language server process
//
//   NotStarted -> Starting -> Running -> ShuttingDown -> Terminated
//                    |           |
//                    +-> Crashed <+
//                          |
//                          +-> Starting (restart)
enum class ServerState {
  kNotStarted,
  kStarting,
  kRunning,
  kShuttingDown,
  kTerminated,
  kCrashed,
};

auto ToString(ServerState state) -> std::string_view;

// Whether the state machine permits moving from `from` to `to`
auto IsValidTransition(ServerState from, ServerState to) -> bool;

}  // namespace codenav::client

template <>
struct fmt::formatter<codenav::client::ServerState>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(codenav::client::ServerState state, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        codenav::client::ToString(state), ctx);
  }
};

#include "codenav/client/server_state.hpp"

namespace codenav::client {

auto ToString(ServerState state) -> std::string_view {
  switch (state) {
    case ServerState::kNotStarted:
      return "NotStarted";
    case ServerState::kStarting:
      return "Starting";
    case ServerState::kRunning:
      return "Running";
    case ServerState::kShuttingDown:
      return "ShuttingDown";
    case ServerState::kTerminated:
      return "Terminated";
    case ServerState::kCrashed:
      return "Crashed";
  }
  return "Unknown";
}

auto IsValidTransition(ServerState from, ServerState to) -> bool {
  switch (from) {
    case ServerState::kNotStarted:
      return to == ServerState::kStarting || to == ServerState::kTerminated;
    case ServerState::kStarting:
      return to == ServerState::kRunning || to == ServerState::kCrashed ||
             to == ServerState::kShuttingDown;
    case ServerState::kRunning:
      return to == ServerState::kShuttingDown || to == ServerState::kCrashed;
    case ServerState::kShuttingDown:
      return to == ServerState::kTerminated;
    case ServerState::kCrashed:
      return to == ServerState::kStarting || to == ServerState::kShuttingDown ||
             to == ServerState::kTerminated;
    case ServerState::kTerminated:
      return false;
  }
  return false;
}

}  // namespace codenav::client

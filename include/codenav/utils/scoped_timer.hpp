#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace codenav::utils {

// Logs the duration of a scope at debug level on destruction
class ScopedTimer {
 public:
  ScopedTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger);
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer(ScopedTimer &&) = delete;
  auto operator=(const ScopedTimer &) -> ScopedTimer & = delete;
  auto operator=(ScopedTimer &&) -> ScopedTimer & = delete;

  [[nodiscard]] auto GetElapsed() const -> std::chrono::milliseconds;

  // Suppresses the log line, for scopes whose outcome is logged elsewhere
  auto Dismiss() -> void {
    dismissed_ = true;
  }

  // Format duration as "123ms" or "1.2s" for readability
  static auto FormatDuration(std::chrono::milliseconds duration) -> std::string;

 private:
  std::chrono::steady_clock::time_point start_;
  std::string operation_name_;
  std::shared_ptr<spdlog::logger> logger_;
  bool dismissed_ = false;
};

}  // namespace codenav::utils

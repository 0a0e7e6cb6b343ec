#pragma once

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#include <unistd.h>

#include "codenav/utils/canonical_path.hpp"

namespace codenav::test {

// Temporary project directory removed on destruction. Each instance gets
// its own directory so fixtures of one test never share files.
class FileTestFixture {
 public:
  FileTestFixture() : FileTestFixture("codenav_test") {
  }

  explicit FileTestFixture(std::string_view prefix) {
    static std::atomic<int> counter{0};
    std::filesystem::path base_temp;
    if (const char* test_tmpdir = std::getenv("TEST_TMPDIR")) {
      base_temp = test_tmpdir;
    } else {
      base_temp = std::filesystem::temp_directory_path();
    }

    temp_dir_ = base_temp / (std::string(prefix) + "_" +
                             std::to_string(::getpid()) + "_" +
                             std::to_string(counter++));
    std::filesystem::remove_all(temp_dir_);
    std::filesystem::create_directories(temp_dir_);
  }

  ~FileTestFixture() {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }

  FileTestFixture(const FileTestFixture&) = delete;
  auto operator=(const FileTestFixture&) -> FileTestFixture& = delete;
  FileTestFixture(FileTestFixture&&) = delete;
  auto operator=(FileTestFixture&&) -> FileTestFixture& = delete;

  [[nodiscard]] auto GetTempDir() const -> CanonicalPath {
    return CanonicalPath(temp_dir_);
  }

  auto CreateFile(std::string_view relative_path, std::string_view content)
      -> CanonicalPath {
    auto file_path = temp_dir_ / relative_path;
    std::filesystem::create_directories(file_path.parent_path());
    std::ofstream file(file_path, std::ios::binary);
    file << content;
    file.close();
    return CanonicalPath(file_path);
  }

  [[nodiscard]] auto ReadFile(std::string_view relative_path) const
      -> std::string {
    std::ifstream file(temp_dir_ / relative_path, std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
  }

  // Number of lines in a --request-log file that equal `method`
  [[nodiscard]] auto CountLogged(
      std::string_view log_name, std::string_view method) const -> int {
    std::ifstream log(temp_dir_ / log_name);
    std::string line;
    int count = 0;
    while (std::getline(log, line)) {
      if (line == method) {
        ++count;
      }
    }
    return count;
  }

 private:
  std::filesystem::path temp_dir_;
};

}  // namespace codenav::test

#pragma once

#include <compare>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace codenav {

// Absolute normalized path of a project file or directory. The same file
// reached through different spellings, or through a file:// URI from a
// language server, yields equal values.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  // Decodes a file:// URI as sent by language servers
  static auto FromUri(std::string_view uri) -> CanonicalPath;

  [[nodiscard]] auto ToUri() const -> std::string;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }
  [[nodiscard]] auto String() const -> const std::string& {
    return string_;
  }

  // True for the directory itself and everything below it
  [[nodiscard]] auto IsWithin(const CanonicalPath& directory) const -> bool;

  // Path relative to `directory` with forward slashes; "" for the directory
  // itself, nullopt when this path lies outside
  [[nodiscard]] auto RelativeTo(const CanonicalPath& directory) const
      -> std::optional<std::string>;

  auto operator/(const std::filesystem::path& rhs) const -> CanonicalPath;

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.string_ == rhs.string_;
  }
  friend auto operator<=>(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> std::strong_ordering {
    return lhs.string_ <=> rhs.string_;
  }

 private:
  std::filesystem::path path_;
  std::string string_;
};

}  // namespace codenav

template <>
struct fmt::formatter<codenav::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const codenav::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};

template <>
struct std::hash<codenav::CanonicalPath> {
  auto operator()(const codenav::CanonicalPath& path) const noexcept
      -> std::size_t {
    return std::hash<std::string>{}(path.String());
  }
};

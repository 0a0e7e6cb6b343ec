#include "codenav/utils/canonical_path.hpp"

#include <algorithm>

#include "codenav/utils/path_utils.hpp"

namespace codenav {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizePath(std::move(path))), string_(path_.string()) {
}

auto CanonicalPath::FromUri(std::string_view uri) -> CanonicalPath {
  return CanonicalPath(UriToPath(uri));
}

auto CanonicalPath::ToUri() const -> std::string {
  return PathToUri(path_);
}

auto CanonicalPath::IsWithin(const CanonicalPath& directory) const -> bool {
  if (path_.empty() || directory.path_.empty()) {
    return false;
  }
  // Component-wise, so "/a/bc" is not inside "/a/b"
  auto [dir_end, _] = std::mismatch(
      directory.path_.begin(), directory.path_.end(), path_.begin(),
      path_.end());
  return dir_end == directory.path_.end();
}

auto CanonicalPath::RelativeTo(const CanonicalPath& directory) const
    -> std::optional<std::string> {
  if (!IsWithin(directory)) {
    return std::nullopt;
  }
  auto relative = path_.lexically_relative(directory.path_).generic_string();
  if (relative == ".") {
    return std::string{};
  }
  return relative;
}

auto CanonicalPath::operator/(const std::filesystem::path& rhs) const
    -> CanonicalPath {
  return CanonicalPath(path_ / rhs);
}

}  // namespace codenav

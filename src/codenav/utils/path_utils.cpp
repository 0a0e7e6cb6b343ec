#include "codenav/utils/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

#include <fmt/format.h>

namespace codenav {

namespace {

constexpr std::string_view kFileScheme = "file://";

auto IsUnreservedUriChar(unsigned char c) -> bool {
  return std::isalnum(c) != 0 || c == '/' || c == '-' || c == '_' ||
         c == '.' || c == '~' || c == ':' || c == '+' || c == '@' || c == '=';
}

}  // namespace

auto UriToPath(std::string_view uri) -> std::filesystem::path {
  if (!uri.starts_with(kFileScheme)) {
    return {std::string(uri)};
  }

  auto encoded = uri.substr(kFileScheme.size());
  std::string decoded;
  decoded.reserve(encoded.size());

  for (std::size_t i = 0; i < encoded.size(); ++i) {
    if (encoded[i] == '%' && i + 2 < encoded.size()) {
      unsigned int value = 0;
      const auto* first = encoded.data() + i + 1;
      auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
      if (ec == std::errc{} && ptr == first + 2) {
        decoded += static_cast<char>(value);
        i += 2;
        continue;
      }
    }
    decoded += encoded[i];
  }

  return NormalizePath(decoded);
}

auto PathToUri(const std::filesystem::path& path) -> std::string {
  std::string result(kFileScheme);
  for (char c : path.string()) {
    const auto uc = static_cast<unsigned char>(c);
    if (IsUnreservedUriChar(uc)) {
      result += c;
    } else {
      result += fmt::format("%{:02X}", uc);
    }
  }
  return result;
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  std::error_code ec;
  if (path.is_relative()) {
    path = std::filesystem::absolute(path, ec);
    if (ec) {
      return path.lexically_normal();
    }
  }
  auto normalized = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  // weakly_canonical keeps a trailing separator for directories given as
  // "dir/"; strip it so equal directories compare equal
  if (normalized.has_parent_path() && !normalized.has_filename()) {
    normalized = normalized.parent_path();
  }
  return normalized;
}

auto HasExtension(
    const std::filesystem::path& path, const std::vector<std::string>& exts)
    -> bool {
  std::string ext = path.extension().string();
  if (ext.empty()) {
    return false;
  }
  std::ranges::transform(
      ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return std::ranges::any_of(exts, [&ext](const std::string& candidate) {
    return std::ranges::equal(ext, candidate, [](char a, char b) {
      return a == std::tolower(static_cast<unsigned char>(b));
    });
  });
}

}  // namespace codenav

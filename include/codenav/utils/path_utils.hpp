#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace codenav {

// URI operations
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(const std::filesystem::path& path) -> std::string;

// Absolute, lexically normal path with symlinks resolved for the part that
// exists on disk
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

// Case-insensitive extension check, extensions include the leading dot
[[nodiscard]] auto HasExtension(
    const std::filesystem::path& path, const std::vector<std::string>& exts)
    -> bool;

}  // namespace codenav

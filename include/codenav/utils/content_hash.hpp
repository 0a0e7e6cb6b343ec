#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace codenav::utils {

using ContentHash = std::uint64_t;

// 64-bit FNV-1a over the raw bytes
[[nodiscard]] auto HashContent(std::string_view content) -> ContentHash;

[[nodiscard]] auto FormatHash(ContentHash hash) -> std::string;

}  // namespace codenav::utils

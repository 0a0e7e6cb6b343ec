#include "codenav/utils/content_hash.hpp"

#include <fmt/format.h>

namespace codenav::utils {

namespace {
constexpr ContentHash kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr ContentHash kFnvPrime = 0x100000001b3ULL;
}  // namespace

auto HashContent(std::string_view content) -> ContentHash {
  ContentHash hash = kFnvOffsetBasis;
  for (char c : content) {
    hash ^= static_cast<unsigned char>(c);
    hash *= kFnvPrime;
  }
  return hash;
}

auto FormatHash(ContentHash hash) -> std::string {
  return fmt::format("{:016x}", hash);
}

}  // namespace codenav::utils

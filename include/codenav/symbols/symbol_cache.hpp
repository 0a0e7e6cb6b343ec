#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/strand.hpp>
#include <spdlog/spdlog.h>

#include "codenav/error/error.hpp"
#include "codenav/symbols/symbol_model.hpp"
#include "codenav/utils/canonical_path.hpp"
#include "codenav/utils/content_hash.hpp"
#include "lsp/basic.hpp"
#include "lsp/document_symbol.hpp"

namespace codenav::symbols {

// Raw documentSymbol answer with the position encoding of the server that
// produced it
struct FetchedSymbols {
  lsp::DocumentSymbolResult result;
  lsp::PositionEncodingKind encoding = lsp::PositionEncodingKind::kUtf16;
};

// Normalized symbol trees keyed by (file, content hash).
//
// An entry is valid exactly while the hash matches the content passed to
// Get. Only the latest entry per file is kept; a changed file misses under
// its new hash and replaces the old tree.
class SymbolCache {
 public:
  using TreePtr = std::shared_ptr<const SymbolTree>;

  // Syncs the document with the server and issues documentSymbol
  using Fetcher = std::function<asio::awaitable<Result<FetchedSymbols>>()>;

  explicit SymbolCache(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  SymbolCache(const SymbolCache&) = delete;
  SymbolCache(SymbolCache&&) = delete;
  auto operator=(const SymbolCache&) -> SymbolCache& = delete;
  auto operator=(SymbolCache&&) -> SymbolCache& = delete;
  ~SymbolCache() = default;

  // Hit: the stored tree, same object, no fetch. Miss: fetch, normalize,
  // store. Fetch errors are returned and nothing is stored.
  auto Get(CanonicalPath path, std::string content, Fetcher fetch)
      -> asio::awaitable<Result<TreePtr>>;

  auto Invalidate(CanonicalPath path) -> asio::awaitable<void>;

  auto Clear() -> asio::awaitable<void>;

  auto Size() -> asio::awaitable<std::size_t>;

  [[nodiscard]] auto Hits() const -> std::size_t {
    return hits_.load();
  }
  [[nodiscard]] auto Misses() const -> std::size_t {
    return misses_.load();
  }

 private:
  struct CacheEntry {
    utils::ContentHash hash = 0;
    TreePtr tree;
    std::chrono::system_clock::time_point stored_at;
  };

  asio::strand<asio::any_io_executor> strand_;
  std::shared_ptr<spdlog::logger> logger_;

  // Protected by strand_
  std::unordered_map<CanonicalPath, CacheEntry> entries_;

  std::atomic<std::size_t> hits_{0};
  std::atomic<std::size_t> misses_{0};
};

}  // namespace codenav::symbols

#include "codenav/symbols/symbol_cache.hpp"

#include <utility>

#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

#include "codenav/utils/scoped_timer.hpp"

namespace codenav::symbols {

SymbolCache::SymbolCache(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : strand_(asio::make_strand(executor)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto SymbolCache::Get(CanonicalPath path, std::string content, Fetcher fetch)
    -> asio::awaitable<Result<TreePtr>> {
  const auto hash = utils::HashContent(content);

  co_await asio::post(strand_, asio::use_awaitable);
  if (auto it = entries_.find(path);
      it != entries_.end() && it->second.hash == hash) {
    ++hits_;
    logger_->trace(
        "SymbolCache hit: {} ({})", path, utils::FormatHash(hash));
    co_return it->second.tree;
  }
  ++misses_;

  utils::ScopedTimer timer(fmt::format("documentSymbol {}", path), logger_);
  auto fetched = co_await fetch();
  if (!fetched) {
    timer.Dismiss();
    co_return std::unexpected(fetched.error());
  }

  auto tree = std::make_shared<const SymbolTree>(
      NormalizeSymbols(fetched->result, content, fetched->encoding));

  // The fetch may have resumed elsewhere
  co_await asio::post(strand_, asio::use_awaitable);
  entries_.insert_or_assign(
      path, CacheEntry{
                .hash = hash,
                .tree = tree,
                .stored_at = std::chrono::system_clock::now(),
            });
  logger_->debug(
      "SymbolCache stored {} top-level symbols for {} ({})", tree->size(),
      path, utils::FormatHash(hash));
  co_return tree;
}

auto SymbolCache::Invalidate(CanonicalPath path) -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);
  entries_.erase(path);
}

auto SymbolCache::Clear() -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);
  logger_->debug("SymbolCache cleared {} entries", entries_.size());
  entries_.clear();
}

auto SymbolCache::Size() -> asio::awaitable<std::size_t> {
  co_await asio::post(strand_, asio::use_awaitable);
  co_return entries_.size();
}

}  // namespace codenav::symbols

#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "cardposter/v1.hpp"
#include "internal/cache/cache_store.hpp"
#include "internal/download/retry_policy.hpp"
#include "internal/fetch/fetcher.hpp"
#include "internal/runtime/cancellation.hpp"

namespace cardposter::download {

struct DownloaderOptions {
  RetryOptions              retry;
  std::chrono::milliseconds timeout{10000};
  uint64_t                  max_image_bytes = 20ull * 1024 * 1024;
  std::string               user_agent      = "card-poster/1.0";
};

/*
  Outcome of resolving one card. Job scoped.

  bytes is null exactly when origin is PLACEHOLDER.
*/
struct ResolvedImage {
  cardposter::v1::CardRef        card;
  std::shared_ptr<arrow::Buffer> bytes;
  cardposter::v1::ImageOrigin    origin   = cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER;
  uint32_t                       attempts = 0; // network requests made
  std::string                    failure_reason;
  bool                           cached    = false; // bytes are in the cache after this resolve
  bool                           cancelled = false; // resolve stopped by cancellation, not a card failure
};

/*
  Resolves card images: cache, then network with retry, then placeholder.

  Per-card failures never throw; they come back as placeholders with a
  reason. The only exception that escapes Resolve() is a util::StorageError
  from the cache lookup, which means the cache itself is unusable.

  Resolve() is safe to call concurrently for distinct cards.
*/
class Downloader {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  Downloader(std::shared_ptr<cache::CacheStore> cache, fetch::FetcherPtr fetcher, DownloaderOptions options,
             RetryPolicy::UniformFn uniform = {}, SleepFn sleep = {});

  ResolvedImage Resolve(const cardposter::v1::CardRef& card, bool cache_opt_out, const runtime::CancellationToken* cancel) const;

  const DownloaderOptions& Options() const {
    return options_;
  }

 private:
  // false when cancelled during the wait
  bool Wait(std::chrono::milliseconds delay, const runtime::CancellationToken* cancel) const;

  // empty string = acceptable image payload
  std::string ValidatePayload(const arrow::Buffer& body) const;

  void StoreInCache(const cache::CacheKey& key, ResolvedImage& resolved) const;

  std::shared_ptr<cache::CacheStore> cache_;
  fetch::FetcherPtr                  fetcher_;
  DownloaderOptions                  options_;
  RetryPolicy                        retry_;
  SleepFn                            sleep_;
};

} // namespace cardposter::download

#include "downloader.hpp"

#include <algorithm>
#include <thread>

#include "internal/image/image_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace cardposter::download {

using cardposter::v1::CardRef;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::chrono::milliseconds kCancelPollInterval{50};

ResolvedImage Placeholder(const CardRef& card, std::string reason, uint32_t attempts) {
  ResolvedImage out;
  out.card           = card;
  out.origin         = cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER;
  out.attempts       = attempts;
  out.failure_reason = std::move(reason);
  return out;
}

ResolvedImage CancelledPlaceholder(const CardRef& card, uint32_t attempts) {
  auto out      = Placeholder(card, "cancelled", attempts);
  out.cancelled = true;
  return out;
}

bool Cancelled(const runtime::CancellationToken* cancel) {
  return cancel && cancel->IsCancelled();
}

} // namespace

Downloader::Downloader(std::shared_ptr<cache::CacheStore> cache, fetch::FetcherPtr fetcher, DownloaderOptions options,
                       RetryPolicy::UniformFn uniform, SleepFn sleep)
    : cache_(std::move(cache)),
      fetcher_(std::move(fetcher)),
      options_(std::move(options)),
      retry_(options_.retry, std::move(uniform)),
      sleep_(std::move(sleep)) {
  if (!cache_ || !fetcher_) {
    throw std::invalid_argument("downloader requires a cache store and a fetcher");
  }
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

bool Downloader::Wait(std::chrono::milliseconds delay, const runtime::CancellationToken* cancel) const {
  // sliced so a cancel during a long backoff is seen promptly
  while (delay.count() > 0) {
    if (Cancelled(cancel)) return false;
    const auto step = std::min(delay, kCancelPollInterval);
    sleep_(step);
    delay -= step;
  }
  return !Cancelled(cancel);
}

std::string Downloader::ValidatePayload(const arrow::Buffer& body) const {
  const auto size = static_cast<uint64_t>(body.size());
  if (size == 0) {
    return "empty image payload";
  }
  if (options_.max_image_bytes > 0 && size > options_.max_image_bytes) {
    return "image payload of " + std::to_string(size) + " bytes exceeds limit of " + std::to_string(options_.max_image_bytes);
  }
  if (!image::ReadHeader(body.data(), static_cast<size_t>(size))) {
    return "undecodable image payload";
  }
  return {};
}

void Downloader::StoreInCache(const cache::CacheKey& key, ResolvedImage& resolved) const {
  try {
    const auto hash = util::Sha256Hex(resolved.bytes->data(), static_cast<size_t>(resolved.bytes->size()));
    cache_->Put(key, resolved.card.image_url(), resolved.bytes, hash);
    resolved.cached = true;
  } catch (const util::StorageError& e) {
    CARDPOSTER_LOG_WARN("cache put failed, using downloaded bytes uncached",
                        {StringField("card_id", resolved.card.id()), StringField("error", e.what())});
  }
}

ResolvedImage Downloader::Resolve(const CardRef& card, bool cache_opt_out, const runtime::CancellationToken* cancel) const {
  if (card.image_url().empty()) {
    CARDPOSTER_LOG_WARN("card has no image url, using placeholder", {StringField("card_id", card.id())});
    return Placeholder(card, "missing image url", 0);
  }

  const auto key = cache::MakeCacheKey(card.image_url());

  if (!cache_opt_out) {
    // StorageError from the index propagates: the job cannot trust the cache
    if (auto entry = cache_->Lookup(key)) {
      try {
        ResolvedImage hit;
        hit.card   = card;
        hit.bytes  = cache_->Read(*entry);
        hit.origin = cardposter::v1::IMAGE_ORIGIN_CACHE;
        hit.cached = true;
        return hit;
      } catch (const std::runtime_error& e) {
        CARDPOSTER_LOG_DEBUG("cache blob unreadable, treating as miss", {StringField("key", key), StringField("error", e.what())});
      }
    }
  }

  fetch::FetchRequest request;
  request.url        = card.image_url();
  request.timeout    = options_.timeout;
  request.max_bytes  = options_.max_image_bytes;
  request.user_agent = options_.user_agent;

  uint32_t attempts = 0;
  uint32_t retries  = 0;
  while (true) {
    if (Cancelled(cancel)) {
      return CancelledPlaceholder(card, attempts);
    }

    auto response = fetcher_->Get(request);
    attempts++;

    std::string reason;
    auto        kind = Classify(response);
    if (kind == FailureKind::kNone) {
      if (!response.body) {
        reason = "empty image payload";
      } else {
        reason = ValidatePayload(*response.body);
      }
      if (reason.empty()) {
        ResolvedImage fetched;
        fetched.card     = card;
        fetched.bytes    = response.body;
        fetched.origin   = cardposter::v1::IMAGE_ORIGIN_NETWORK;
        fetched.attempts = attempts;
        if (!cache_opt_out) {
          StoreInCache(key, fetched);
        }
        return fetched;
      }
      kind = FailureKind::kPermanent;
    } else {
      reason = DescribeFailure(response);
    }

    if (kind == FailureKind::kTransient && retry_.ShouldRetry(retries)) {
      const auto delay = retry_.Backoff(retries);
      CARDPOSTER_LOG_DEBUG("transient fetch failure, retrying", {StringField("card_id", card.id()), StringField("reason", reason),
                                                                  IntField("attempt", attempts), IntField("backoff_ms", delay.count())});
      retries++;
      if (!Wait(delay, cancel)) {
        return CancelledPlaceholder(card, attempts);
      }
      continue;
    }

    if (kind == FailureKind::kTransient) {
      reason = "retries exhausted: " + reason;
    }
    CARDPOSTER_LOG_WARN("image unavailable, using placeholder",
                        {StringField("card_id", card.id()), StringField("reason", reason), IntField("attempts", attempts)});
    return Placeholder(card, std::move(reason), attempts);
  }
}

} // namespace cardposter::download

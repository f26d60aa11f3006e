#include "internal/download/downloader.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/cache_key.hpp"
#include "internal/db/memory/memory_cache_index.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fake_fetcher.hpp"

namespace {

using cardposter::download::Downloader;
using cardposter::download::DownloaderOptions;
using cardposter::fetch::FetchStatus;
using cardposter::testing::FakeFetcher;
using cardposter::testing::HttpResponse;
using cardposter::testing::SolidPng;
using cardposter::testing::TransportFailure;
using cardposter::v1::CardRef;

CardRef Card(const std::string& id, const std::string& url) {
  CardRef card;
  card.set_id(id);
  card.set_name("Card " + id);
  card.set_generation(1);
  card.set_image_url(url);
  return card;
}

struct Fixture {
  std::shared_ptr<cardposter::cache::CacheStore> cache;
  std::shared_ptr<FakeFetcher>                   fetcher = std::make_shared<FakeFetcher>();
  std::vector<std::chrono::milliseconds>         sleeps;

  explicit Fixture(uint32_t max_retries = 3) {
    cache = std::make_shared<cardposter::cache::CacheStore>(std::make_shared<cardposter::db::memory::MemoryCacheIndex>(),
                                                            std::make_shared<cardposter::storage::RamBlobStore>(),
                                                            cardposter::cache::CacheOptions{});
    options.retry.max_retries  = max_retries;
    options.retry.base_backoff = std::chrono::milliseconds(100);
    options.retry.max_backoff  = std::chrono::milliseconds(1000);
  }

  Downloader Make() {
    return Downloader(cache, fetcher, options, [] { return 1.0; },
                      [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
  }

  DownloaderOptions options;
};

void TestSecondResolveMakesNoNetworkRequest() {
  Fixture    f;
  const auto url = "https://images.example/base1/4.png";
  f.fetcher->Serve(url, SolidPng(4, 6, {200, 10, 10, 255}));
  auto downloader = f.Make();

  auto first = downloader.Resolve(Card("base1-4", url), false, nullptr);
  assert(first.origin == cardposter::v1::IMAGE_ORIGIN_NETWORK);
  assert(first.attempts == 1);
  assert(first.cached);
  assert(first.bytes);

  auto second = downloader.Resolve(Card("base1-4", url), false, nullptr);
  assert(second.origin == cardposter::v1::IMAGE_ORIGIN_CACHE);
  assert(second.attempts == 0);
  assert(second.bytes->Equals(*first.bytes));
  assert(f.fetcher->Calls() == 1);
}

void TestCacheOptOutSkipsLookupAndPut() {
  Fixture    f;
  const auto url = "https://images.example/base1/2.png";
  f.fetcher->Serve(url, SolidPng(4, 6, {0, 0, 200, 255}));
  auto downloader = f.Make();

  auto first = downloader.Resolve(Card("base1-2", url), true, nullptr);
  assert(first.origin == cardposter::v1::IMAGE_ORIGIN_NETWORK);
  assert(!first.cached);
  assert(!f.cache->Lookup(cardposter::cache::MakeCacheKey(url)).has_value());

  auto second = downloader.Resolve(Card("base1-2", url), true, nullptr);
  assert(second.origin == cardposter::v1::IMAGE_ORIGIN_NETWORK);
  assert(f.fetcher->Calls() == 2);
}

void TestTransientFailuresAreRetriedWithBackoff() {
  Fixture    f;
  const auto url = "https://images.example/flaky.png";
  f.fetcher->Script(url, {HttpResponse(503), TransportFailure(FetchStatus::kTimeout), HttpResponse(200, SolidPng(2, 2, {1, 2, 3, 255}))});
  auto downloader = f.Make();

  auto resolved = downloader.Resolve(Card("flaky", url), false, nullptr);
  assert(resolved.origin == cardposter::v1::IMAGE_ORIGIN_NETWORK);
  assert(resolved.attempts == 3);

  // uniform() == 1.0 gives the full capped delay, slept in 50ms slices
  std::chrono::milliseconds total{0};
  for (auto d : f.sleeps) total += d;
  assert(total == std::chrono::milliseconds(100 + 200));
}

void TestRetriesExhaustedBecomesPlaceholder() {
  Fixture    f(2);
  const auto url = "https://images.example/down.png";
  f.fetcher->Script(url, {HttpResponse(500)});
  auto downloader = f.Make();

  auto resolved = downloader.Resolve(Card("down", url), false, nullptr);
  assert(resolved.origin == cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER);
  assert(!resolved.bytes);
  assert(resolved.attempts == 3);
  assert(resolved.failure_reason.find("retries exhausted") == 0);
  assert(resolved.failure_reason.find("HTTP 500") != std::string::npos);
}

void TestPermanentFailureIsNotRetried() {
  Fixture    f;
  const auto url = "https://images.example/missing.png";
  f.fetcher->Script(url, {HttpResponse(404)});
  auto downloader = f.Make();

  auto resolved = downloader.Resolve(Card("missing", url), false, nullptr);
  assert(resolved.origin == cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER);
  assert(resolved.attempts == 1);
  assert(resolved.failure_reason == "HTTP 404");
  assert(f.sleeps.empty());
}

void TestUndecodablePayloadIsPermanent() {
  Fixture    f;
  const auto url = "https://images.example/html.png";
  f.fetcher->Script(url, {HttpResponse(200, arrow::Buffer::FromString("<html>rate limited</html>"))});
  auto downloader = f.Make();

  auto resolved = downloader.Resolve(Card("html", url), false, nullptr);
  assert(resolved.origin == cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER);
  assert(resolved.attempts == 1);
  assert(resolved.failure_reason == "undecodable image payload");
  assert(!resolved.cancelled);
  assert(!f.cache->Lookup(cardposter::cache::MakeCacheKey(url)).has_value());
}

void TestOversizedPayloadIsPermanent() {
  Fixture f;
  f.options.max_image_bytes = 16;
  const auto url            = "https://images.example/huge.png";
  f.fetcher->Serve(url, SolidPng(64, 64, {9, 9, 9, 255}));
  auto downloader = f.Make();

  auto resolved = downloader.Resolve(Card("huge", url), false, nullptr);
  assert(resolved.origin == cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER);
  assert(resolved.failure_reason.find("exceeds limit") != std::string::npos);
}

void TestMissingUrlIsPlaceholderWithoutRequest() {
  Fixture f;
  auto    downloader = f.Make();

  auto resolved = downloader.Resolve(Card("blank", ""), false, nullptr);
  assert(resolved.origin == cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER);
  assert(resolved.failure_reason == "missing image url");
  assert(f.fetcher->Calls() == 0);
}

void TestCancelledBeforeFetch() {
  Fixture    f;
  const auto url = "https://images.example/base1/1.png";
  f.fetcher->Serve(url, SolidPng(2, 2, {1, 1, 1, 255}));
  auto downloader = f.Make();

  cardposter::runtime::CancellationToken token;
  token.Cancel();

  auto resolved = downloader.Resolve(Card("base1-1", url), false, &token);
  assert(resolved.origin == cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER);
  assert(resolved.failure_reason == "cancelled");
  assert(resolved.cancelled);
  assert(f.fetcher->Calls() == 0);
}

void TestCancelDuringBackoffStopsRetrying() {
  Fixture    f(5);
  const auto url = "https://images.example/slow.png";
  f.fetcher->Script(url, {HttpResponse(503)});

  cardposter::runtime::CancellationToken token;
  Downloader downloader(f.cache, f.fetcher, f.options, [] { return 1.0; }, [&token](std::chrono::milliseconds) { token.Cancel(); });

  auto resolved = downloader.Resolve(Card("slow", url), false, &token);
  assert(resolved.origin == cardposter::v1::IMAGE_ORIGIN_PLACEHOLDER);
  assert(resolved.failure_reason == "cancelled");
  assert(resolved.cancelled);
  assert(resolved.attempts == 1);
  assert(f.fetcher->Calls() == 1);
}

} // namespace

int main() {
  TestSecondResolveMakesNoNetworkRequest();
  TestCacheOptOutSkipsLookupAndPut();
  TestTransientFailuresAreRetriedWithBackoff();
  TestRetriesExhaustedBecomesPlaceholder();
  TestPermanentFailureIsNotRetried();
  TestUndecodablePayloadIsPermanent();
  TestOversizedPayloadIsPermanent();
  TestMissingUrlIsPlaceholderWithoutRequest();
  TestCancelledBeforeFetch();
  TestCancelDuringBackoffStopsRetrying();

  std::cout << "cardposter_unit_downloader: pass\n";
  return 0;
}

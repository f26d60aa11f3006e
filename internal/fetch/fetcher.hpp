#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace cardposter::fetch {

enum class FetchStatus {
  kOk = 0,          // transport succeeded; see http_code
  kTimeout,         // request exceeded its deadline
  kConnectionError, // DNS, connect, TLS, reset
  kInvalidUrl,      // malformed or unsupported scheme
  kTooLarge,        // body exceeded max_bytes, transfer aborted
};

struct FetchRequest {
  std::string               url;
  std::chrono::milliseconds timeout{10000};
  uint64_t                  max_bytes = 0; // 0 = unlimited
  std::string               user_agent;
};

struct FetchResponse {
  FetchStatus                    status    = FetchStatus::kConnectionError;
  long                           http_code = 0;
  std::shared_ptr<arrow::Buffer> body;
  std::string                    content_type;
  std::string                    error;

  bool Ok() const {
    return status == FetchStatus::kOk && http_code >= 200 && http_code < 300;
  }
};

const char* FetchStatusName(FetchStatus status);

/*
  Blocking single-URL GET.

  Implementations never throw for per-request failures; everything a
  retry policy needs is in FetchResponse. Safe to call from several
  worker threads at once.
*/
class Fetcher {
 public:
  virtual ~Fetcher() = default;

  virtual FetchResponse Get(const FetchRequest& request) = 0;
};

using FetcherPtr = std::shared_ptr<Fetcher>;

} // namespace cardposter::fetch

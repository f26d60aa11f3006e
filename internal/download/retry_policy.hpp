#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "internal/fetch/fetcher.hpp"

namespace cardposter::download {

enum class FailureKind {
  kNone = 0,
  kTransient, // retry
  kPermanent, // placeholder now
};

struct RetryOptions {
  uint32_t                  max_retries = 3;
  std::chrono::milliseconds base_backoff{250};
  std::chrono::milliseconds max_backoff{4000};
};

/*
  Transient: timeout, connection error, HTTP 5xx, HTTP 429.
  Permanent: every other non-2xx, invalid URL, oversized body.
*/
FailureKind Classify(const fetch::FetchResponse& response);

std::string DescribeFailure(const fetch::FetchResponse& response);

/*
  Exponential backoff with jitter.

  delay(attempt) = min(base * 2^attempt, max); the returned wait is drawn
  uniformly from [delay/2, delay]. attempt is 0 for the first retry.
*/
class RetryPolicy {
 public:
  // returns a value in [0, 1)
  using UniformFn = std::function<double()>;

  explicit RetryPolicy(RetryOptions options, UniformFn uniform = {});

  bool ShouldRetry(uint32_t retries_done) const {
    return retries_done < options_.max_retries;
  }

  std::chrono::milliseconds CappedDelay(uint32_t attempt) const;
  std::chrono::milliseconds Backoff(uint32_t attempt) const;

  const RetryOptions& Options() const {
    return options_;
  }

 private:
  RetryOptions options_;
  UniformFn    uniform_;
};

} // namespace cardposter::download

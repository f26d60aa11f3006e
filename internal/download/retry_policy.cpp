#include "retry_policy.hpp"

#include <algorithm>
#include <random>

namespace cardposter::download {

FailureKind Classify(const fetch::FetchResponse& response) {
  switch (response.status) {
    case fetch::FetchStatus::kTimeout:
    case fetch::FetchStatus::kConnectionError:
      return FailureKind::kTransient;
    case fetch::FetchStatus::kInvalidUrl:
    case fetch::FetchStatus::kTooLarge:
      return FailureKind::kPermanent;
    case fetch::FetchStatus::kOk:
      break;
  }

  const long code = response.http_code;
  if (code >= 200 && code < 300) return FailureKind::kNone;
  if (code == 429 || code >= 500) return FailureKind::kTransient;
  return FailureKind::kPermanent;
}

std::string DescribeFailure(const fetch::FetchResponse& response) {
  if (response.status == fetch::FetchStatus::kOk) {
    return "HTTP " + std::to_string(response.http_code);
  }
  std::string out = fetch::FetchStatusName(response.status);
  if (!response.error.empty()) {
    out += ": " + response.error;
  }
  return out;
}

RetryPolicy::RetryPolicy(RetryOptions options, UniformFn uniform) : options_(options), uniform_(std::move(uniform)) {
  if (!uniform_) {
    uniform_ = [] {
      static thread_local std::mt19937_64        rng{std::random_device{}()};
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      return dist(rng);
    };
  }
}

std::chrono::milliseconds RetryPolicy::CappedDelay(uint32_t attempt) const {
  const auto base = std::max<int64_t>(options_.base_backoff.count(), 0);
  const auto cap  = std::max<int64_t>(options_.max_backoff.count(), base);

  // doubling stops at the cap, large attempts cannot overflow
  int64_t delay = base;
  for (uint32_t i = 0; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, cap));
}

std::chrono::milliseconds RetryPolicy::Backoff(uint32_t attempt) const {
  const auto   delay = CappedDelay(attempt).count();
  const double half  = static_cast<double>(delay) / 2.0;
  const double u     = std::clamp(uniform_(), 0.0, 1.0);
  return std::chrono::milliseconds(static_cast<int64_t>(half + u * half));
}

} // namespace cardposter::download

#include "time.hpp"

#include <ctime>

namespace cardposter::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatLocal(TimePoint tp, const char* format) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  localtime_r(&t, &tm);

  char buf[128];
  const auto n = std::strftime(buf, sizeof(buf), format, &tm);
  return std::string(buf, n);
}

std::string FormatIso8601(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf, n);
}

} // namespace cardposter::util

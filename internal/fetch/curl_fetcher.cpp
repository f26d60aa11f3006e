#include "curl_fetcher.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace cardposter::fetch {

namespace {

struct Sink {
  std::string body;
  uint64_t    max_bytes = 0;
  bool        overflow  = false;
};

size_t WriteToSink(void* contents, size_t size, size_t nmemb, void* userp) {
  const size_t n    = size * nmemb;
  auto*        sink = static_cast<Sink*>(userp);
  if (sink->max_bytes > 0 && sink->body.size() + n > sink->max_bytes) {
    sink->overflow = true;
    return 0; // aborts the transfer with CURLE_WRITE_ERROR
  }
  sink->body.append(static_cast<const char*>(contents), n);
  return n;
}

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

FetchStatus Classify(CURLcode code) {
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      return FetchStatus::kTimeout;
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
      return FetchStatus::kInvalidUrl;
    default:
      return FetchStatus::kConnectionError;
  }
}

} // namespace

const char* FetchStatusName(FetchStatus status) {
  switch (status) {
    case FetchStatus::kOk:
      return "ok";
    case FetchStatus::kTimeout:
      return "timeout";
    case FetchStatus::kConnectionError:
      return "connection error";
    case FetchStatus::kInvalidUrl:
      return "invalid url";
    case FetchStatus::kTooLarge:
      return "payload too large";
  }
  return "unknown";
}

CurlFetcher::CurlFetcher() {
  EnsureCurlGlobalInit();
}

FetchResponse CurlFetcher::Get(const FetchRequest& request) {
  FetchResponse response;

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    response.status = FetchStatus::kConnectionError;
    response.error  = "curl_easy_init failed";
    return response;
  }

  Sink sink;
  sink.max_bytes = request.max_bytes;

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (!request.user_agent.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, request.user_agent.c_str());
  }
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteToSink);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));

  const CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    response.status = sink.overflow ? FetchStatus::kTooLarge : Classify(code);
    response.error  = sink.overflow ? "response exceeds " + std::to_string(request.max_bytes) + " bytes" : curl_easy_strerror(code);
    return response;
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.http_code);

  char* content_type = nullptr;
  if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
    response.content_type = content_type;
  }

  response.status = FetchStatus::kOk;
  response.body   = arrow::Buffer::FromString(std::move(sink.body));
  if (!response.Ok()) {
    response.error = "HTTP " + std::to_string(response.http_code);
  }
  return response;
}

} // namespace cardposter::fetch

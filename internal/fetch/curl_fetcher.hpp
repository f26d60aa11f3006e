#pragma once

#include "internal/fetch/fetcher.hpp"

namespace cardposter::fetch {

/*
  libcurl fetcher. One easy handle per request, redirects followed,
  whole-request timeout from FetchRequest.
*/
class CurlFetcher final : public Fetcher {
 public:
  CurlFetcher();

  FetchResponse Get(const FetchRequest& request) override;
};

} // namespace cardposter::fetch

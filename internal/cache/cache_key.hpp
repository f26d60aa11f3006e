#pragma once

#include <string>
#include <string_view>

namespace cardposter::cache {

/*
  Cache key = lowercase hex SHA-256 of the exact source URL bytes.

  No normalization: two URLs that differ in any byte are different keys.
*/
using CacheKey = std::string;

CacheKey MakeCacheKey(std::string_view source_url);

} // namespace cardposter::cache

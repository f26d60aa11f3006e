#include "cache_key.hpp"

#include "internal/util/hash.hpp"

namespace cardposter::cache {

CacheKey MakeCacheKey(std::string_view source_url) {
  return util::Sha256Hex(source_url);
}

} // namespace cardposter::cache

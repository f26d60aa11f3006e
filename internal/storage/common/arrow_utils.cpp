#include "arrow_utils.hpp"

#include <system_error>

#include "path_utils.hpp"

namespace cardposter::storage::common {

void WriteFileAtomic(const std::filesystem::path& destination, const uint8_t* data, int64_t size, bool fsync) {
  const auto tmp_path = TempPathFor(destination);

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
    Unwrap(out->Write(data, size));

    if (fsync)
      Unwrap(out->Flush());

    Unwrap(out->Close());

    std::filesystem::rename(tmp_path, destination);
  } catch (const std::exception&) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw;
  }
}

} // namespace cardposter::storage::common

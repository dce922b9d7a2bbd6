#include "file_responder.h"

#include <cstdint>
#include <cstdlib>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  const std::string url_path(reinterpret_cast<const char *>(data), size);
  const std::filesystem::path root = "/srv/www";

  const auto resolved = coiserve::ResolveRequestPath(root, url_path);
  if (!resolved) {
    return 0;
  }

  for (const auto &part : resolved->lexically_relative(root)) {
    if (part.string() == "..") {
      std::abort();
    }
  }
  return 0;
}

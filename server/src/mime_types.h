#pragma once

#include <filesystem>
#include <string>

namespace coiserve {

// Content type for a file, from its extension. Falls back to
// application/octet-stream.
std::string GuessMimeType(const std::filesystem::path &path);

}  // namespace coiserve

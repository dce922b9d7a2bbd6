#include "mime_types.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace coiserve {

namespace {
const std::unordered_map<std::string, std::string> &MimeTable() {
  static const std::unordered_map<std::string, std::string> kTable = {
      {".html", "text/html"},
      {".htm", "text/html"},
      {".css", "text/css"},
      {".js", "text/javascript"},
      {".mjs", "text/javascript"},
      {".json", "application/json"},
      {".map", "application/json"},
      {".wasm", "application/wasm"},
      {".txt", "text/plain"},
      {".md", "text/markdown"},
      {".csv", "text/csv"},
      {".xml", "application/xml"},
      {".svg", "image/svg+xml"},
      {".png", "image/png"},
      {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},
      {".gif", "image/gif"},
      {".webp", "image/webp"},
      {".ico", "image/vnd.microsoft.icon"},
      {".bmp", "image/bmp"},
      {".glb", "model/gltf-binary"},
      {".gltf", "model/gltf+json"},
      {".wav", "audio/x-wav"},
      {".mp3", "audio/mpeg"},
      {".ogg", "audio/ogg"},
      {".mp4", "video/mp4"},
      {".webm", "video/webm"},
      {".woff", "font/woff"},
      {".woff2", "font/woff2"},
      {".ttf", "font/ttf"},
      {".otf", "font/otf"},
      {".pdf", "application/pdf"},
      {".zip", "application/zip"},
      {".gz", "application/gzip"},
      {".tar", "application/x-tar"},
  };
  return kTable;
}
}

std::string GuessMimeType(const std::filesystem::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  const auto &table = MimeTable();
  const auto it = table.find(ext);
  if (it == table.end()) {
    return "application/octet-stream";
  }
  return it->second;
}

}  // namespace coiserve

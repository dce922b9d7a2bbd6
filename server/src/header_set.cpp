#include "header_set.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace coiserve {

namespace {
bool EqualsIgnoreCase(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

bool IsTokenChar(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) ||
         (ch != '\0' && std::strchr("!#$%&'*+-.^_`|~", ch) != nullptr);
}

bool IsValidName(const std::string &name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), IsTokenChar);
}

bool IsValidValue(const std::string &value) {
  return std::none_of(value.begin(), value.end(), [](char ch) {
    const auto byte = static_cast<unsigned char>(ch);
    return (byte < 0x20 && ch != '\t') || byte == 0x7F;
  });
}
}

HeaderSet::HeaderSet(std::vector<Entry> entries) : entries_(std::move(entries)) {
  for (const auto &entry : entries_) {
    if (!IsValidName(entry.first)) {
      throw std::invalid_argument("Invalid header name: " + entry.first);
    }
    if (!IsValidValue(entry.second)) {
      throw std::invalid_argument("Invalid value for header " + entry.first);
    }
  }
}

std::optional<std::string> HeaderSet::Find(const std::string &name) const {
  // Later entries win in ApplyTo, so search from the back.
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    if (EqualsIgnoreCase(it->first, name)) {
      return it->second;
    }
  }
  return std::nullopt;
}

void HeaderSet::ApplyTo(httplib::Response &res) const {
  for (const auto &entry : entries_) {
    res.headers.erase(entry.first);
    res.set_header(entry.first, entry.second);
  }
}

HeaderSet BuildIsolationHeaderSet() {
  return HeaderSet({
      {"Cross-Origin-Opener-Policy", "same-origin"},
      {"Cross-Origin-Embedder-Policy", "require-corp"},
      {"Access-Control-Allow-Origin", "*"},
      {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
      {"Access-Control-Allow-Headers", "*"},
      {"Cache-Control", "no-store, no-cache, must-revalidate"},
  });
}

}  // namespace coiserve

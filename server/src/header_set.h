#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "httplib.h"

namespace coiserve {

// Fixed, ordered list of response headers stamped onto every response.
// Built once at startup and never mutated afterwards.
class HeaderSet {
public:
  using Entry = std::pair<std::string, std::string>;

  HeaderSet() = default;
  // Throws std::invalid_argument for a name that is not an HTTP token or a
  // value with control characters; httplib would silently drop either.
  explicit HeaderSet(std::vector<Entry> entries);

  const std::vector<Entry> &entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // Case-insensitive lookup by header name.
  std::optional<std::string> Find(const std::string &name) const;

  // Replaces any same-named headers already on the response, so every entry
  // ends up present exactly once with this set's value.
  void ApplyTo(httplib::Response &res) const;

private:
  std::vector<Entry> entries_;
};

HeaderSet BuildIsolationHeaderSet();

}  // namespace coiserve

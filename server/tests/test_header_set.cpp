#include "doctest.h"

#include "header_set.h"

#include <stdexcept>
#include <vector>

TEST_CASE("BuildIsolationHeaderSet carries the six isolation headers in order") {
  const auto headers = coiserve::BuildIsolationHeaderSet();

  REQUIRE(headers.size() == 6);
  const auto &entries = headers.entries();
  CHECK(entries[0].first == "Cross-Origin-Opener-Policy");
  CHECK(entries[0].second == "same-origin");
  CHECK(entries[1].first == "Cross-Origin-Embedder-Policy");
  CHECK(entries[1].second == "require-corp");
  CHECK(entries[2].first == "Access-Control-Allow-Origin");
  CHECK(entries[2].second == "*");
  CHECK(entries[3].first == "Access-Control-Allow-Methods");
  CHECK(entries[3].second == "GET, POST, OPTIONS");
  CHECK(entries[4].first == "Access-Control-Allow-Headers");
  CHECK(entries[4].second == "*");
  CHECK(entries[5].first == "Cache-Control");
  CHECK(entries[5].second == "no-store, no-cache, must-revalidate");
}

TEST_CASE("HeaderSet::Find ignores case") {
  const auto headers = coiserve::BuildIsolationHeaderSet();

  CHECK(headers.Find("cross-origin-embedder-policy").value_or("") == "require-corp");
  CHECK_FALSE(headers.Find("X-Missing").has_value());
}

TEST_CASE("HeaderSet::ApplyTo replaces existing values regardless of case") {
  const coiserve::HeaderSet headers({{"Cache-Control", "no-store"}});
  httplib::Response res;
  res.set_header("cache-control", "public, max-age=60");
  res.set_header("Content-Type", "text/plain");

  headers.ApplyTo(res);

  CHECK(res.get_header_value_count("Cache-Control") == 1);
  CHECK(res.get_header_value("Cache-Control") == "no-store");
  CHECK(res.get_header_value("Content-Type") == "text/plain");
}

TEST_CASE("HeaderSet::ApplyTo lets a later duplicate entry win") {
  const coiserve::HeaderSet headers({{"X-Mode", "first"}, {"x-mode", "second"}});
  httplib::Response res;

  headers.ApplyTo(res);

  CHECK(res.get_header_value_count("X-Mode") == 1);
  CHECK(res.get_header_value("X-Mode") == "second");
  CHECK(headers.Find("X-MODE").value_or("") == "second");
}

TEST_CASE("Empty HeaderSet leaves the response alone") {
  const coiserve::HeaderSet headers;
  httplib::Response res;
  res.set_header("X-Keep", "1");

  headers.ApplyTo(res);

  CHECK(headers.empty());
  CHECK(res.headers.size() == 1);
}

TEST_CASE("HeaderSet rejects entries httplib would refuse to send") {
  using Entries = std::vector<coiserve::HeaderSet::Entry>;

  CHECK_THROWS_AS(coiserve::HeaderSet(Entries{{"X-Split", "a\r\nX-Injected: b"}}),
                  std::invalid_argument);
  CHECK_THROWS_AS(coiserve::HeaderSet(Entries{{"X-Line", "a\nb"}}), std::invalid_argument);
  CHECK_THROWS_AS(coiserve::HeaderSet(Entries{{"", "value"}}), std::invalid_argument);
  CHECK_THROWS_AS(coiserve::HeaderSet(Entries{{"Bad Name", "value"}}), std::invalid_argument);
  CHECK_THROWS_AS(coiserve::HeaderSet(Entries{{"Bad:Name", "value"}}), std::invalid_argument);
  CHECK_NOTHROW(coiserve::HeaderSet(Entries{{"X-Tabbed", "a\tb"}}));
}

TEST_CASE("Every valid entry survives ApplyTo exactly once") {
  const coiserve::HeaderSet headers({{"X-Tabbed", "a\tb"}, {"X-Plain", "value"}});
  httplib::Response res;

  headers.ApplyTo(res);

  CHECK(res.get_header_value_count("X-Tabbed") == 1);
  CHECK(res.get_header_value("X-Tabbed") == "a\tb");
  CHECK(res.get_header_value_count("X-Plain") == 1);
}

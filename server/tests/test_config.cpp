#include "doctest.h"

#include "config.h"

TEST_CASE("ParseArgs defaults to port 8080") {
  const char *argv[] = {"coiserve_server"};
  const int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));

  const auto result = ParseArgs(argc, argv);

  CHECK(result.errors.empty());
  CHECK(result.config.port == 8080);
  CHECK(result.config.host == "0.0.0.0");
  CHECK(result.config.root == ".");
}

TEST_CASE("ParseArgs takes the port as a positional argument") {
  const char *argv[] = {"coiserve_server", "9090"};
  const int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));

  const auto result = ParseArgs(argc, argv);

  CHECK(result.errors.empty());
  CHECK(result.config.port == 9090);
}

TEST_CASE("ParseArgs reports invalid ports") {
  const char *bad_text[] = {"coiserve_server", "abc"};
  auto result = ParseArgs(2, bad_text);
  REQUIRE(result.errors.size() == 1);
  CHECK(result.errors[0] == "Invalid port value: abc");
  CHECK(result.config.port == 8080);

  const char *trailing[] = {"coiserve_server", "80x"};
  result = ParseArgs(2, trailing);
  REQUIRE(result.errors.size() == 1);
  CHECK(result.errors[0] == "Invalid port value: 80x");

  const char *too_big[] = {"coiserve_server", "70000"};
  result = ParseArgs(2, too_big);
  REQUIRE(result.errors.size() == 1);
  CHECK(result.errors[0] == "Port out of range: 70000");

  const char *zero[] = {"coiserve_server", "0"};
  result = ParseArgs(2, zero);
  REQUIRE(result.errors.size() == 1);
  CHECK(result.errors[0] == "Port out of range: 0");
}

TEST_CASE("ParseArgs rejects extra arguments") {
  const char *argv[] = {"coiserve_server", "9000", "--verbose"};
  const int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));

  const auto result = ParseArgs(argc, argv);

  REQUIRE(result.errors.size() == 1);
  CHECK(result.errors[0] == "Unexpected argument: --verbose");
  CHECK(result.config.port == 9000);
}

TEST_CASE("ValidateConfig accepts the defaults") {
  ServerConfig config;

  CHECK(ValidateConfig(config).empty());
}

TEST_CASE("ValidateConfig requires an existing document root") {
  ServerConfig config;
  config.root = "/nonexistent/coiserve/root";

  const auto errors = ValidateConfig(config);

  REQUIRE(errors.size() == 1);
  CHECK(errors[0].find("Document root") != std::string::npos);
}

TEST_CASE("ValidateConfig checks port range and host") {
  ServerConfig config;
  config.port = 0;
  config.host.clear();

  const auto errors = ValidateConfig(config);

  CHECK(errors.size() == 2);
}

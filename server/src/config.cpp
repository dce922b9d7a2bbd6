#include "config.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace {
constexpr int kMaxPositionalArgs = 1;

int ParsePort(const std::string &value, std::vector<std::string> &errors) {
  try {
    size_t idx = 0;
    int port = std::stoi(value, &idx);
    if (idx != value.size()) {
      errors.push_back("Invalid port value: " + value);
      return -1;
    }
    if (port <= 0 || port > 65535) {
      errors.push_back("Port out of range: " + value);
      return -1;
    }
    return port;
  } catch (const std::exception &) {
    errors.push_back("Invalid port value: " + value);
    return -1;
  }
}
}

ParseResult ParseArgs(int argc, const char *const *argv) {
  ParseResult result;

  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (positional >= kMaxPositionalArgs) {
      result.errors.push_back("Unexpected argument: " + arg);
      continue;
    }
    ++positional;
    const int port = ParsePort(arg, result.errors);
    if (port > 0) {
      result.config.port = port;
    }
  }

  return result;
}

std::vector<std::string> ValidateConfig(const ServerConfig &config) {
  std::vector<std::string> errors;
  if (config.port <= 0 || config.port > 65535) {
    errors.push_back("Port out of range: " + std::to_string(config.port));
  }
  if (config.host.empty()) {
    errors.push_back("Bind host must not be empty");
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(config.root, ec)) {
    errors.push_back("Document root is not a directory: " + config.root);
  }
  return errors;
}

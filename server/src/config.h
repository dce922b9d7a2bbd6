#pragma once

#include <string>
#include <vector>

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
  std::string root = ".";
  std::string banner_title = "Cross-origin isolated development server";
};

struct ParseResult {
  ServerConfig config;
  std::vector<std::string> errors;
};

// Accepts a single optional positional port argument.
ParseResult ParseArgs(int argc, const char *const *argv);
std::vector<std::string> ValidateConfig(const ServerConfig &config);

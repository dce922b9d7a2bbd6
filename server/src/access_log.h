#pragma once

#include <cstddef>
#include <string>

#include "httplib.h"

struct AccessLogEntry {
  std::string utc_timestamp;
  std::string method;
  std::string path;
  int status = 0;
  size_t bytes = 0;
  std::string remote;
};

// HEAD responses are logged with zero bytes since no body is sent.
AccessLogEntry MakeAccessLogEntry(const httplib::Request &req, const httplib::Response &res);

// One JSON object per line, no trailing newline.
std::string FormatAccessLog(const AccessLogEntry &entry);
std::string EscapeJson(const std::string &value);
std::string NowUtcTimestamp();

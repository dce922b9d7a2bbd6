#include "access_log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string EscapeJson(const std::string &value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(value.size() + 8);
  for (char ch : value) {
    switch (ch) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default: {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte < 0x20) {
          out += "\\u00";
          out += kHex[byte >> 4];
          out += kHex[byte & 0x0F];
        } else {
          out += ch;
        }
        break;
      }
    }
  }
  return out;
}

AccessLogEntry MakeAccessLogEntry(const httplib::Request &req, const httplib::Response &res) {
  AccessLogEntry entry;
  entry.utc_timestamp = NowUtcTimestamp();
  entry.method = req.method;
  entry.path = req.path;
  entry.status = res.status;
  entry.bytes = req.method == "HEAD" ? 0 : res.body.size();
  entry.remote = req.remote_addr;
  return entry;
}

std::string FormatAccessLog(const AccessLogEntry &entry) {
  std::ostringstream out;
  out << "{\"ts\":\"" << EscapeJson(entry.utc_timestamp)
      << "\",\"method\":\"" << EscapeJson(entry.method)
      << "\",\"path\":\"" << EscapeJson(entry.path)
      << "\",\"status\":" << entry.status
      << ",\"bytes\":" << entry.bytes
      << ",\"remote\":\"" << EscapeJson(entry.remote) << "\"}";
  return out.str();
}

std::string NowUtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  std::tm utc_tm{};
  gmtime_r(&time, &utc_tm);
  std::ostringstream out;
  out << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

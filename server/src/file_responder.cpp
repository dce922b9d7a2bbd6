#include "file_responder.h"
#include "mime_types.h"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <utility>

namespace coiserve {

namespace {
const char *kHtmlContentType = "text/html;charset=utf-8";

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool EndsWithSlash(const std::string &value) {
  return !value.empty() && value.back() == '/';
}
}

std::optional<std::filesystem::path> ResolveRequestPath(const std::filesystem::path &root,
                                                        const std::string &url_path) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= url_path.size()) {
    size_t end = url_path.find('/', start);
    if (end == std::string::npos) {
      end = url_path.size();
    }
    std::string segment = url_path.substr(start, end - start);
    start = end + 1;

    if (segment.empty() || segment == ".") {
      continue;
    }
    if (segment.find('\0') != std::string::npos || segment.find('\\') != std::string::npos) {
      return std::nullopt;
    }
    if (segment == "..") {
      if (!segments.empty()) {
        segments.pop_back();
      }
      continue;
    }
    segments.push_back(std::move(segment));
  }

  std::filesystem::path resolved = root;
  for (const auto &segment : segments) {
    resolved /= segment;
  }
  return resolved;
}

std::string EscapeHtml(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    switch (ch) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#x27;";
        break;
      default:
        out += ch;
        break;
    }
  }
  return out;
}

std::string PercentEncodePath(const std::string &value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    const auto byte = static_cast<unsigned char>(ch);
    if (std::isalnum(byte) || ch == '-' || ch == '.' || ch == '_' || ch == '~' || ch == '/') {
      out += ch;
    } else {
      out += '%';
      out += kHex[byte >> 4];
      out += kHex[byte & 0x0F];
    }
  }
  return out;
}

std::string FormatHttpDate(std::time_t time) {
  std::tm utc_tm{};
  gmtime_r(&time, &utc_tm);
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::put_time(&utc_tm, "%a, %d %b %Y %H:%M:%S GMT");
  return out.str();
}

std::string BuildDirectoryListing(const std::string &url_path,
                                  std::vector<ListingEntry> entries) {
  std::sort(entries.begin(), entries.end(), [](const ListingEntry &a, const ListingEntry &b) {
    return ToLower(a.name) < ToLower(b.name);
  });

  const std::string title = "Directory listing for " + EscapeHtml(url_path);
  std::ostringstream out;
  out << "<!DOCTYPE HTML>\n"
      << "<html lang=\"en\">\n"
      << "<head>\n"
      << "<meta charset=\"utf-8\">\n"
      << "<title>" << title << "</title>\n"
      << "</head>\n"
      << "<body>\n"
      << "<h1>" << title << "</h1>\n"
      << "<hr>\n<ul>\n";
  for (const auto &entry : entries) {
    std::string display = entry.name;
    std::string link = entry.name;
    if (entry.is_directory) {
      display += "/";
      link += "/";
    }
    if (entry.is_symlink) {
      display = entry.name + "@";
    }
    out << "<li><a href=\"" << EscapeHtml(PercentEncodePath(link)) << "\">"
        << EscapeHtml(display) << "</a></li>\n";
  }
  out << "</ul>\n<hr>\n</body>\n</html>\n";
  return out.str();
}

std::string BuildErrorPage(int status, const std::string &message) {
  std::ostringstream out;
  out << "<!DOCTYPE HTML>\n"
      << "<html lang=\"en\">\n"
      << "    <head>\n"
      << "        <meta charset=\"utf-8\">\n"
      << "        <title>Error response</title>\n"
      << "    </head>\n"
      << "    <body>\n"
      << "        <h1>Error response</h1>\n"
      << "        <p>Error code: " << status << "</p>\n"
      << "        <p>Message: " << EscapeHtml(message) << ".</p>\n"
      << "        <p>Error code explanation: " << status << " - "
      << httplib::status_message(status) << ".</p>\n"
      << "    </body>\n"
      << "</html>\n";
  return out.str();
}

void RespondError(httplib::Response &res, int status, const std::string &message) {
  res.status = status;
  res.set_content(BuildErrorPage(status, message), kHtmlContentType);
}

FileResponder::FileResponder(std::filesystem::path root) : root_(std::move(root)) {}

void FileResponder::Respond(const httplib::Request &req, httplib::Response &res) {
  if (req.method != "GET" && req.method != "HEAD") {
    RespondError(res, 501, "Unsupported method ('" + req.method + "')");
    return;
  }

  const auto resolved = ResolveRequestPath(root_, req.path);
  if (!resolved) {
    RespondError(res, 404, "File not found");
    return;
  }

  std::error_code ec;
  const auto status = std::filesystem::status(*resolved, ec);
  if (ec || !std::filesystem::exists(status)) {
    RespondError(res, 404, "File not found");
    return;
  }

  if (std::filesystem::is_directory(status)) {
    if (!EndsWithSlash(req.path)) {
      res.status = 301;
      res.set_header("Location", PercentEncodePath(req.path) + "/");
      return;
    }
    RespondDirectory(req, *resolved, res);
    return;
  }

  // "/file.txt/" names a directory that does not exist.
  if (EndsWithSlash(req.path) || !std::filesystem::is_regular_file(status)) {
    RespondError(res, 404, "File not found");
    return;
  }

  RespondFile(*resolved, res);
}

void FileResponder::RespondDirectory(const httplib::Request &req,
                                     const std::filesystem::path &dir,
                                     httplib::Response &res) const {
  for (const char *index : {"index.html", "index.htm"}) {
    const auto candidate = dir / index;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      RespondFile(candidate, res);
      return;
    }
  }

  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    RespondError(res, 404, "No permission to list directory");
    return;
  }

  std::vector<ListingEntry> entries;
  const std::filesystem::directory_iterator end;
  while (it != end) {
    ListingEntry entry;
    entry.name = it->path().filename().string();
    std::error_code type_ec;
    entry.is_symlink = it->is_symlink(type_ec);
    entry.is_directory = it->is_directory(type_ec);
    entries.push_back(std::move(entry));

    it.increment(ec);
    if (ec) {
      RespondError(res, 404, "No permission to list directory");
      return;
    }
  }

  res.status = 200;
  res.set_content(BuildDirectoryListing(req.path, std::move(entries)), kHtmlContentType);
}

void FileResponder::RespondFile(const std::filesystem::path &file,
                                httplib::Response &res) const {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    RespondError(res, 404, "File not found");
    return;
  }
  std::ostringstream body;
  body << in.rdbuf();
  if (in.bad()) {
    RespondError(res, 404, "File not found");
    return;
  }

  struct stat info {};
  if (::stat(file.c_str(), &info) == 0) {
    res.set_header("Last-Modified", FormatHttpDate(info.st_mtime));
  }

  res.status = 200;
  res.set_content(body.str(), GuessMimeType(file));
}

}  // namespace coiserve

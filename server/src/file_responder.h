#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "static_responder.h"

#include "httplib.h"

namespace coiserve {

struct ListingEntry {
  std::string name;
  bool is_directory = false;
  bool is_symlink = false;
};

// Maps an already-decoded URL path onto a path under root. ".." never climbs
// above root. Returns nullopt for paths that cannot name a file.
std::optional<std::filesystem::path> ResolveRequestPath(const std::filesystem::path &root,
                                                        const std::string &url_path);

std::string BuildDirectoryListing(const std::string &url_path,
                                  std::vector<ListingEntry> entries);
std::string BuildErrorPage(int status, const std::string &message);
std::string FormatHttpDate(std::time_t time);
std::string EscapeHtml(const std::string &value);
std::string PercentEncodePath(const std::string &value);

// Serves GET and HEAD from a document root. Directories are answered with
// index.html / index.htm or a generated listing.
class FileResponder : public StaticResponder {
public:
  explicit FileResponder(std::filesystem::path root);

  void Respond(const httplib::Request &req, httplib::Response &res) override;

  const std::filesystem::path &root() const { return root_; }

private:
  void RespondDirectory(const httplib::Request &req, const std::filesystem::path &dir,
                        httplib::Response &res) const;
  void RespondFile(const std::filesystem::path &file, httplib::Response &res) const;

  std::filesystem::path root_;
};

void RespondError(httplib::Response &res, int status, const std::string &message);

}  // namespace coiserve

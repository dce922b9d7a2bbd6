#include "usage.h"

#include <filesystem>
#include <sstream>
#include <system_error>

std::string UsageText(const char *argv0) {
  std::ostringstream out;
  out << "Usage: " << argv0 << " [port]\n";
  out << "\nServes the current directory with cross-origin isolation headers\n";
  out << "(COOP same-origin, COEP require-corp) so SharedArrayBuffer is available.\n";
  out << "\nArguments:\n";
  out << "  port            TCP port to listen on (default 8080)\n";
  return out.str();
}

std::string BannerText(const ServerConfig &config, const coiserve::HeaderSet &headers) {
  std::error_code ec;
  auto root = std::filesystem::absolute(config.root, ec);
  if (ec) {
    root = config.root;
  }

  std::ostringstream out;
  out << config.banner_title << "\n";
  out << "Serving " << root.string() << " at http://localhost:" << config.port << "/"
      << " (bound to " << config.host << ":" << config.port << ")\n";
  const auto coop = headers.Find("Cross-Origin-Opener-Policy");
  const auto coep = headers.Find("Cross-Origin-Embedder-Policy");
  out << "Cross-origin isolation: COOP " << coop.value_or("unset") << ", COEP "
      << coep.value_or("unset") << "\n";
  out << "Press Ctrl-C to stop\n";
  return out.str();
}

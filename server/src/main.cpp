#include "access_log.h"
#include "config.h"
#include "file_responder.h"
#include "gateway.h"
#include "header_set.h"
#include "shutdown.h"
#include "usage.h"

#include "httplib.h"

#include <iostream>
#include <string>
#include <thread>

int main(int argc, char **argv) {
  auto parse = ParseArgs(argc, argv);
  auto config_errors = ValidateConfig(parse.config);
  parse.errors.insert(parse.errors.end(), config_errors.begin(), config_errors.end());

  if (!parse.errors.empty()) {
    for (const auto &error : parse.errors) {
      std::cerr << error << "\n";
    }
    std::cout << UsageText(argv[0]);
    return 1;
  }

  coiserve::FileResponder responder(parse.config.root);
  const coiserve::HeaderInjectingGateway gateway(coiserve::BuildIsolationHeaderSet(), responder);

  httplib::Server server;
  gateway.Attach(server);

  server.set_logger([](const httplib::Request &req, const httplib::Response &res) {
    std::cout << FormatAccessLog(MakeAccessLogEntry(req, res)) + "\n";
  });

  if (!server.bind_to_port(parse.config.host, parse.config.port)) {
    std::cerr << "Failed to bind to " << parse.config.host << ":" << parse.config.port << "\n";
    return 1;
  }

  std::cout << BannerText(parse.config, gateway.headers()) << std::flush;

  ScopedShutdownHandler stop_handler(server);
  bool listened = false;
  std::thread listener([&] { listened = server.listen_after_bind(); });
  server.wait_until_ready();
  stop_handler.StopIfTriggered();
  listener.join();
  if (stop_handler.triggered()) {
    std::cout << "Interrupt received, shutting down\n";
    return 0;
  }
  if (!listened) {
    std::cerr << "Listener on " << parse.config.host << ":" << parse.config.port
              << " stopped unexpectedly\n";
    return 1;
  }
  return 0;
}

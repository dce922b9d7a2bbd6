#include "shutdown.h"

#include <signal.h>

#include <atomic>

namespace {
std::atomic<httplib::Server *> g_server{nullptr};
std::atomic<bool> g_triggered{false};

// Whoever clears g_server owns the single stop() call.
void StopOnce() {
  httplib::Server *server = g_server.load();
  if (server != nullptr && g_server.compare_exchange_strong(server, nullptr)) {
    server->stop();
  }
}

void HandleStopSignal(int) {
  g_triggered.store(true);
  httplib::Server *server = g_server.load();
  if (server != nullptr && server->is_running()) {
    StopOnce();
  }
}
}

ScopedShutdownHandler::ScopedShutdownHandler(httplib::Server &server) {
  g_triggered.store(false);
  g_server.store(&server);

  struct sigaction action {};
  action.sa_handler = HandleStopSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, &previous_int_);
  sigaction(SIGTERM, &action, &previous_term_);
}

ScopedShutdownHandler::~ScopedShutdownHandler() {
  sigaction(SIGINT, &previous_int_, nullptr);
  sigaction(SIGTERM, &previous_term_, nullptr);
  g_server.store(nullptr);
}

void ScopedShutdownHandler::StopIfTriggered() {
  if (g_triggered.load()) {
    StopOnce();
  }
}

bool ScopedShutdownHandler::triggered() const {
  return g_triggered.load();
}

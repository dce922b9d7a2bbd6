#pragma once

#include <signal.h>

#include "httplib.h"

// Stops the server on SIGINT/SIGTERM so listen() returns and main can exit
// cleanly. Install before listening; a signal that lands before the server
// is running is only recorded, and StopIfTriggered() acts on it once
// wait_until_ready() has returned. stop() is called at most once. Previous
// handlers are restored on destruction. Only one instance may be alive at a
// time.
class ScopedShutdownHandler {
public:
  explicit ScopedShutdownHandler(httplib::Server &server);
  ~ScopedShutdownHandler();

  ScopedShutdownHandler(const ScopedShutdownHandler &) = delete;
  ScopedShutdownHandler &operator=(const ScopedShutdownHandler &) = delete;

  void StopIfTriggered();
  bool triggered() const;

private:
  struct sigaction previous_int_{};
  struct sigaction previous_term_{};
};

#pragma once

#include "header_set.h"
#include "static_responder.h"

#include "httplib.h"

namespace coiserve {

// Wraps a StaticResponder and guarantees the HeaderSet on every response.
// OPTIONS requests are answered here and never reach the responder.
class HeaderInjectingGateway {
public:
  HeaderInjectingGateway(HeaderSet headers, StaticResponder &responder);

  // Decides status and body. Does not touch the HeaderSet headers.
  void Handle(const httplib::Request &req, httplib::Response &res) const;

  // Must run after everything else that writes headers.
  void InjectHeaders(httplib::Response &res) const;

  void Serve(const httplib::Request &req, httplib::Response &res) const;

  // Routes every method and path through Handle and registers InjectHeaders
  // as the post-routing hook, which the server runs after its own header
  // handling and just before writing the header block. The gateway must
  // outlive the server.
  void Attach(httplib::Server &server) const;

  const HeaderSet &headers() const { return headers_; }

private:
  HeaderSet headers_;
  StaticResponder &responder_;
};

}  // namespace coiserve

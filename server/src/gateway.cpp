#include "gateway.h"

#include <string>
#include <utility>

namespace coiserve {

namespace {
// Unlike ".*", also matches decoded paths containing newlines.
const char *kAnyPath = R"([\s\S]*)";

bool HasRouteTable(const std::string &method) {
  return method == "GET" || method == "HEAD" || method == "POST" || method == "PUT" ||
         method == "PATCH" || method == "DELETE" || method == "OPTIONS";
}
}

HeaderInjectingGateway::HeaderInjectingGateway(HeaderSet headers, StaticResponder &responder)
    : headers_(std::move(headers)), responder_(responder) {}

void HeaderInjectingGateway::Handle(const httplib::Request &req, httplib::Response &res) const {
  if (req.method == "OPTIONS") {
    res.status = 200;
    res.body.clear();
    return;
  }
  responder_.Respond(req, res);
}

void HeaderInjectingGateway::InjectHeaders(httplib::Response &res) const {
  headers_.ApplyTo(res);
}

void HeaderInjectingGateway::Serve(const httplib::Request &req, httplib::Response &res) const {
  Handle(req, res);
  InjectHeaders(res);
}

void HeaderInjectingGateway::Attach(httplib::Server &server) const {
  const httplib::Server::Handler handler = [this](const httplib::Request &req,
                                                  httplib::Response &res) { Handle(req, res); };
  // Registered per method so the server reads request bodies before dispatch.
  // GET routes also receive HEAD.
  server.Get(kAnyPath, handler);
  server.Post(kAnyPath, handler);
  server.Put(kAnyPath, handler);
  server.Patch(kAnyPath, handler);
  server.Delete(kAnyPath, handler);
  server.Options(kAnyPath, handler);

  server.set_pre_routing_handler([this](const httplib::Request &req, httplib::Response &res) {
    if (HasRouteTable(req.method)) {
      return httplib::Server::HandlerResponse::Unhandled;
    }
    Handle(req, res);
    return httplib::Server::HandlerResponse::Handled;
  });

  // Also reached for responses the server builds itself (400, 413, ...).
  server.set_post_routing_handler([this](const httplib::Request &, httplib::Response &res) {
    InjectHeaders(res);
  });
}

}  // namespace coiserve

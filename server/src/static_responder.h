#pragma once

#include "httplib.h"

namespace coiserve {

// Produces status, headers and body for a request. Implementations must not
// assume they get the last word on headers.
class StaticResponder {
public:
  virtual ~StaticResponder() = default;
  virtual void Respond(const httplib::Request &req, httplib::Response &res) = 0;
};

}  // namespace coiserve

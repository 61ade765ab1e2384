#pragma once

#include <cstdint>

#include <chremote/http/router.h>

namespace chremote::http {

// A set of routes mounted on one or more HTTP servers, told when a server
// starts or stops serving them.
class IServlet {
public:
    virtual ~IServlet() = default;

    // Installs the routes. Called once per server, before it starts.
    virtual void Register(Router& router) = 0;

    virtual void BoundTo(std::uint16_t port) = 0;
    virtual void UnboundFrom(std::uint16_t port) = 0;
};

} // namespace chremote::http

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>

#include <chremote/http/router.h>
#include <chremote/http/servlet.h>
#include <chremote/runtime/app.h>

namespace chremote::http {

struct ListenAddress {
    std::string host;
    std::uint16_t port = 0; // 0 picks a free port
};

class HttpServer final : public chremote::IHttpServer, public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& ioc, ListenAddress addr, Router router);

    // Must be called before Start().
    void AddServlet(std::shared_ptr<IServlet> servlet);

    void Start() override;
    void Stop() override;

    // Bound port once started, 0 otherwise.
    std::uint16_t port() const { return bound_port_.load(std::memory_order_acquire); }

private:
    void DoAccept();

    boost::asio::io_context& ioc_;
    ListenAddress addr_;
    Router router_;
    std::vector<std::shared_ptr<IServlet>> servlets_;

    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
};

} // namespace chremote::http

#include <chremote/http/http_server.h>

#include <chremote/http/types.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <chremote/core/log.h>

#include <string_view>

namespace chremote::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

std::string_view ExtractPath(std::string_view target) {
    auto q = target.find('?');
    if (q == std::string_view::npos) {
        return target;
    }
    return target.substr(0, q);
}

void ParseQuery(std::string_view target, std::unordered_map<std::string, std::string>& out) {
    auto q = target.find('?');
    if (q == std::string_view::npos || q + 1 >= target.size()) {
        return;
    }

    std::string_view s = target.substr(q + 1);
    while (!s.empty()) {
        auto amp = s.find('&');
        auto part = (amp == std::string_view::npos) ? s : s.substr(0, amp);
        auto eq = part.find('=');
        if (eq != std::string_view::npos) {
            out.emplace(std::string(part.substr(0, eq)), std::string(part.substr(eq + 1)));
        } else if (!part.empty()) {
            out.emplace(std::string(part), "");
        }
        if (amp == std::string_view::npos) {
            break;
        }
        s.remove_prefix(amp + 1);
    }
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, Router& router)
        : stream_(std::move(socket)), router_(router) {
        beast::error_code ec;
        auto remote = stream_.socket().remote_endpoint(ec);
        if (!ec) {
            remote_address_ = remote.address().to_string();
        }
    }

    void Run() {
        Read();
    }

private:
    void Read() {
        req_ = {};
        http::async_read(stream_, buffer_, req_,
            beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            return;
        }

        Request req;
        req.raw = std::move(req_);
        auto target_sv = std::string_view(req.raw.target().data(), req.raw.target().size());
        req.path = std::string(ExtractPath(target_sv));
        ParseQuery(target_sv, req.query);
        req.remote_address = remote_address_;

        Response resp;
        router_.Handle(req, resp);

        http::response<http::string_body> out{http::status(resp.status), req.raw.version()};
        out.keep_alive(req.raw.keep_alive());
        out.set(http::field::server, "chremote/0.1");
        out.set(http::field::content_type, resp.content_type);
        for (const auto& h : resp.headers) {
            out.set(h.first, h.second);
        }
        out.body() = std::move(resp.body);
        out.prepare_payload();

        chremote::log::debug("{} {} from {} -> {}",
            std::string_view(req.raw.method_string().data(), req.raw.method_string().size()),
            req.path, remote_address_, resp.status);

        auto sp = std::make_shared<http::response<http::string_body>>(std::move(out));
        http::async_write(stream_, *sp,
            beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), sp->need_eof(), sp));
    }

    void OnWrite(bool close, std::shared_ptr<void>, beast::error_code ec, std::size_t) {
        if (ec) {
            return;
        }
        if (close) {
            return DoClose();
        }
        Read();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    Router& router_;
    std::string remote_address_;
};

} // namespace

std::string_view Request::Query(std::string_view key) const {
    auto it = query.find(std::string(key));
    if (it == query.end()) {
        return {};
    }
    return it->second;
}

void Response::SetJson(std::string json, unsigned status_code) {
    status = status_code;
    content_type = std::string(kContentTypeJson);
    body = std::move(json);
}

void Response::SetText(unsigned status_code, std::string text) {
    status = status_code;
    content_type = std::string(kContentTypeText);
    body = std::move(text);
}

HttpServer::HttpServer(boost::asio::io_context& ioc, ListenAddress addr, Router router)
    : ioc_(ioc), addr_(std::move(addr)), router_(std::move(router)), acceptor_(ioc) {}

void HttpServer::AddServlet(std::shared_ptr<IServlet> servlet) {
    servlet->Register(router_);
    servlets_.push_back(std::move(servlet));
}

void HttpServer::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    beast::error_code ec;
    auto address = boost::asio::ip::make_address(addr_.host, ec);
    if (ec) {
        chremote::log::error("invalid listen address {}: {}", addr_.host, ec.message());
        return;
    }
    tcp::endpoint endpoint{address, addr_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        chremote::log::error("acceptor open failed: {}", ec.message());
        return;
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        chremote::log::warn("acceptor set_option failed: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        chremote::log::error("acceptor bind failed: {}", ec.message());
        return;
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        chremote::log::error("acceptor listen failed: {}", ec.message());
        return;
    }

    auto local = acceptor_.local_endpoint(ec);
    auto port = ec ? addr_.port : local.port();
    bound_port_.store(port, std::memory_order_release);

    chremote::log::info("HTTP server listening on {}:{}", addr_.host, port);
    for (const auto& servlet : servlets_) {
        servlet->BoundTo(port);
    }
    DoAccept();
}

void HttpServer::Stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    auto port = bound_port_.exchange(0, std::memory_order_acq_rel);
    if (port != 0) {
        for (const auto& servlet : servlets_) {
            servlet->UnboundFrom(port);
        }
    }

    beast::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
}

void HttpServer::DoAccept() {
    acceptor_.async_accept(boost::asio::make_strand(ioc_),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (self->running_.load(std::memory_order_relaxed)) {
                    chremote::log::warn("accept failed: {}", ec.message());
                    self->DoAccept();
                }
                return;
            }

            std::make_shared<HttpSession>(std::move(socket), self->router_)->Run();
            self->DoAccept();
        });
}

} // namespace chremote::http

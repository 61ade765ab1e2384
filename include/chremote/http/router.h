#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include <chremote/http/types.h>

namespace chremote::http {

using Handler = std::function<void(const Request&, Response&)>;
using Next = std::function<void()>;
using Middleware = std::function<void(const Request&, Response&, Next)>;

class Router {
public:
    // Thread-safe for read after construction. Build routes before serving.
    void Use(Middleware mw);

    void AddRoute(boost::beast::http::verb method, std::string path, Handler handler);

    // Matches `prefix` itself and every path below it ("<prefix>/...").
    // Exact routes win; among prefixes the longest wins.
    void AddPrefixRoute(boost::beast::http::verb method, std::string prefix, Handler handler);

    void Get(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::get, std::move(path), std::move(handler)); }
    void Post(std::string path, Handler handler) { AddRoute(boost::beast::http::verb::post, std::move(path), std::move(handler)); }

    // A handler throwing std::exception yields a 500 response.
    void Handle(const Request& req, Response& resp) const;

private:
    struct RouteKey {
        boost::beast::http::verb method;
        std::string path;

        bool operator==(const RouteKey& o) const { return method == o.method && path == o.path; }
    };

    struct RouteKeyHash {
        std::size_t operator()(const RouteKey& k) const;
    };

    const Handler* Find(boost::beast::http::verb method, std::string_view path) const;

    std::vector<Middleware> middleware_;
    std::unordered_map<RouteKey, Handler, RouteKeyHash> routes_;
    std::unordered_map<RouteKey, Handler, RouteKeyHash> prefixes_;
};

} // namespace chremote::http

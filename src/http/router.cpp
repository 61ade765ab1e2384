#include <chremote/http/router.h>

#include <chremote/core/log.h>

#include <boost/functional/hash.hpp>

#include <exception>

namespace chremote::http {

std::size_t Router::RouteKeyHash::operator()(const RouteKey& k) const {
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<unsigned>(k.method));
    boost::hash_combine(seed, k.path);
    return seed;
}

void Router::Use(Middleware mw) {
    middleware_.push_back(std::move(mw));
}

void Router::AddRoute(boost::beast::http::verb method, std::string path, Handler handler) {
    routes_[RouteKey{method, std::move(path)}] = std::move(handler);
}

void Router::AddPrefixRoute(boost::beast::http::verb method, std::string prefix, Handler handler) {
    while (prefix.size() > 1 && prefix.back() == '/') {
        prefix.pop_back();
    }
    prefixes_[RouteKey{method, std::move(prefix)}] = std::move(handler);
}

const Handler* Router::Find(boost::beast::http::verb method, std::string_view path) const {
    if (auto it = routes_.find(RouteKey{method, std::string(path)}); it != routes_.end()) {
        return &it->second;
    }

    // Walk up the path one segment at a time: "/a/b/c", "/a/b", "/a", "/".
    std::string candidate(path);
    while (!candidate.empty()) {
        if (auto it = prefixes_.find(RouteKey{method, candidate}); it != prefixes_.end()) {
            return &it->second;
        }
        if (candidate == "/") {
            break;
        }
        auto slash = candidate.rfind('/');
        if (slash == std::string::npos) {
            break;
        }
        candidate.resize(slash == 0 ? 1 : slash);
    }
    return nullptr;
}

void Router::Handle(const Request& req, Response& resp) const {
    const auto* found = Find(req.raw.method(), req.path);
    if (found == nullptr) {
        resp.status = 404;
        resp.content_type = "application/json; charset=utf-8";
        resp.body = "{\"error\":\"not_found\"}";
        return;
    }

    const auto& handler = *found;

    // Build middleware chain.
    std::size_t idx = 0;
    std::function<void()> run;
    run = [&]() {
        if (idx < middleware_.size()) {
            auto& mw = middleware_[idx++];
            mw(req, resp, run);
            return;
        }
        handler(req, resp);
    };

    try {
        run();
    } catch (const std::exception& ex) {
        chremote::log::error("handler for {} failed: {}", req.path, ex.what());
        resp.headers.clear();
        resp.SetText(500, "Internal error");
    }
}

} // namespace chremote::http

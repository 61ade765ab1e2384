#include <chremote/remote/registry_servlet.h>

#include <chremote/core/log.h>
#include <chremote/http/http_client.h>

#include <algorithm>
#include <exception>

namespace chremote::remote {
namespace {

namespace beast_http = boost::beast::http;

std::string NormalizePath(std::string path) {
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

bool IsEndpointsPath(std::string_view rel) {
    return rel == "/endpoints" || rel == "/endpoints/";
}

constexpr std::string_view kEndpointPrefix = "/endpoint/";

} // namespace

RegistryServlet::RegistryServlet(Dispatcher& dispatcher,
                                 IImportRegistry& registry,
                                 std::string path,
                                 std::chrono::milliseconds push_timeout)
    : dispatcher_(dispatcher),
      registry_(registry),
      path_(NormalizePath(std::move(path))),
      push_timeout_(push_timeout) {
    chremote::log::debug("dispatcher servlet for {} on {}", dispatcher_.framework_uid(), path_);
}

void RegistryServlet::Register(chremote::http::Router& router) {
    router.AddPrefixRoute(beast_http::verb::get, path_,
        [this](const chremote::http::Request& req, chremote::http::Response& resp) { HandleGet(req, resp); });
    router.AddPrefixRoute(beast_http::verb::post, path_,
        [this](const chremote::http::Request& req, chremote::http::Response& resp) { HandlePost(req, resp); });
}

void RegistryServlet::BoundTo(std::uint16_t port) {
    std::lock_guard<std::mutex> lk(mu_);
    if (std::find(ports_.begin(), ports_.end(), port) == ports_.end()) {
        ports_.push_back(port);
        chremote::log::info("dispatcher servlet bound to port {} at {}", port, path_);
    }
}

void RegistryServlet::UnboundFrom(std::uint16_t port) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find(ports_.begin(), ports_.end(), port);
    if (it != ports_.end()) {
        ports_.erase(it);
        chremote::log::info("dispatcher servlet unbound from port {}", port);
    }
}

bool RegistryServlet::active() const {
    std::lock_guard<std::mutex> lk(mu_);
    return !ports_.empty();
}

std::optional<std::pair<std::uint16_t, std::string>> RegistryServlet::Access() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (ports_.empty()) {
        return std::nullopt;
    }
    return std::make_pair(ports_.front(), path_);
}

std::optional<std::string_view> RegistryServlet::Relative(std::string_view path) const {
    if (path_ == "/") {
        return path;
    }
    if (path.substr(0, path_.size()) != path_) {
        return std::nullopt;
    }
    auto rest = path.substr(path_.size());
    if (!rest.empty() && rest.front() != '/') {
        return std::nullopt;
    }
    return rest;
}

void RegistryServlet::HandleGet(const chremote::http::Request& req, chremote::http::Response& resp) const {
    if (!active()) {
        resp.SetText(503, "Dispatcher servlet not bound");
        return;
    }

    auto rel = Relative(req.path);
    if (!rel) {
        resp.SetText(404, "Unhandled path");
        return;
    }

    if (IsEndpointsPath(*rel)) {
        resp.SetJson(wire::DumpEndpoints(dispatcher_.GetEndpoints(), dispatcher_.framework_uid()));
        return;
    }

    if (rel->substr(0, kEndpointPrefix.size()) == kEndpointPrefix) {
        auto uid = rel->substr(kEndpointPrefix.size());
        if (!uid.empty() && uid.find('/') == std::string_view::npos) {
            auto endpoint = dispatcher_.GetEndpoint(uid);
            if (!endpoint) {
                resp.SetText(404, "Unknown UID: " + std::string(uid));
                return;
            }
            resp.SetJson(wire::DumpEndpoint(*endpoint, dispatcher_.framework_uid()));
            return;
        }
    }

    resp.SetText(404, "Unhandled path");
}

void RegistryServlet::HandlePost(const chremote::http::Request& req, chremote::http::Response& resp) {
    if (!active()) {
        resp.SetText(503, "Dispatcher servlet not bound");
        return;
    }

    auto rel = Relative(req.path);
    if (!rel || !IsEndpointsPath(*rel)) {
        resp.SetText(404, "Unhandled path");
        return;
    }

    auto records = wire::ParseRecords(req.raw.body());
    if (!records.ok()) {
        chremote::log::warn("invalid endpoints payload from {}: {}", req.remote_address, records.status().message());
        resp.SetText(400, "Invalid endpoints payload: " + records.status().message());
        return;
    }

    for (auto& record : records.value()) {
        auto uid = record.uid;
        auto st = RegisterEndpoint(req.remote_address, std::move(record));
        if (!st.ok()) {
            chremote::log::debug("endpoint {} from {} not registered: {}", uid, req.remote_address, st.ToString());
        }
    }

    resp.SetText(200, "OK");
}

chremote::Status RegistryServlet::RegisterEndpoint(std::string_view host_address, wire::Record record) {
    auto endpoint = wire::ToImportEndpoint(std::move(record), std::string(host_address));
    if (!endpoint.ok()) {
        return endpoint.status();
    }
    if (!registry_.Add(endpoint.value())) {
        return chremote::Status(chremote::StatusCode::already_exists,
            "endpoint " + endpoint.value()->uid() + " refused by the import registry");
    }
    return chremote::Status::Ok();
}

void RegistryServlet::SendDiscovered(const std::string& host, std::uint16_t port, const std::string& path) const {
    try {
        auto body = wire::DumpEndpoints(dispatcher_.GetEndpoints(), dispatcher_.framework_uid());

        std::string target = path;
        if (target.empty() || target.back() != '/') {
            target.push_back('/');
        }
        target.append("endpoints");

        auto r = chremote::http::HttpClient::Post(host, std::to_string(port), target, std::move(body),
            chremote::http::kContentTypeJson, push_timeout_);
        if (!r.ok()) {
            chremote::log::error("error accessing a discovered framework at {}:{}: {}", host, port, r.status().ToString());
            return;
        }

        const auto& result = r.value();
        if (result.status < 200 || result.status >= 300) {
            chremote::log::warn("got an HTTP code {} when contacting a discovered framework at {}:{}: {}",
                result.status, host, port, result.body);
            return;
        }
        chremote::log::debug("endpoints announced to {}:{}{}", host, port, target);
    } catch (const std::exception& ex) {
        chremote::log::error("error accessing a discovered framework at {}:{}: {}", host, port, ex.what());
    }
}

} // namespace chremote::remote

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <chremote/http/servlet.h>
#include <chremote/remote/dispatcher.h>
#include <chremote/remote/import_registry.h>
#include <chremote/remote/wire.h>

namespace chremote::remote {

inline constexpr std::string_view kDefaultServletPath = "/chremote-dispatcher";

// HTTP face of the dispatcher, mounted under a base path:
//   GET  {base}/endpoints       all local endpoints
//   GET  {base}/endpoint/{uid}  one local endpoint
//   POST {base}/endpoints       endpoints announced by a peer
// and the client side announcing local endpoints to a discovered peer.
class RegistryServlet final : public chremote::http::IServlet {
public:
    RegistryServlet(Dispatcher& dispatcher,
                    IImportRegistry& registry,
                    std::string path = std::string(kDefaultServletPath),
                    std::chrono::milliseconds push_timeout = std::chrono::milliseconds(5000));

    const std::string& path() const { return path_; }

    void Register(chremote::http::Router& router) override;

    // Thread-safe
    void BoundTo(std::uint16_t port) override;
    void UnboundFrom(std::uint16_t port) override;

    // Serving only while bound to at least one server.
    bool active() const;

    // First bound port and the servlet path; nullopt while unbound.
    std::optional<std::pair<std::uint16_t, std::string>> Access() const;

    void HandleGet(const chremote::http::Request& req, chremote::http::Response& resp) const;
    void HandlePost(const chremote::http::Request& req, chremote::http::Response& resp);

    // Transforms one announced record into an import endpoint and hands it to
    // the import registry.
    chremote::Status RegisterEndpoint(std::string_view host_address, wire::Record record);

    // POSTs every local endpoint to {path}/endpoints on the peer. Failures are
    // logged, never thrown. Blocking.
    void SendDiscovered(const std::string& host, std::uint16_t port, const std::string& path) const;

private:
    // Path below the base path ("" for the base itself), nullopt outside it.
    std::optional<std::string_view> Relative(std::string_view path) const;

    Dispatcher& dispatcher_;
    IImportRegistry& registry_;
    const std::string path_;
    const std::chrono::milliseconds push_timeout_;

    mutable std::mutex mu_;
    std::vector<std::uint16_t> ports_;
};

} // namespace chremote::remote

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <chremote/core/status.h>

#include <chjson/chjson.hpp>

namespace chremote::config {

class Config {
public:
    static chremote::Result<Config> LoadFile(std::string path);
    static chremote::Result<Config> Parse(std::string_view text);

    bool Has(std::string_view key) const;

    chremote::Result<std::string> GetString(std::string_view key) const;
    chremote::Result<int> GetInt(std::string_view key) const;
    chremote::Result<std::vector<std::string>> GetStringList(std::string_view key) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    chjson::document doc_;
};

struct HostPort {
    std::string host;
    std::uint16_t port = 0;
};

// "host:port", port in 1..65535.
chremote::Result<HostPort> ParseHostPort(std::string_view s);

struct PeerAddress {
    std::string host;
    std::uint16_t port = 0;
    std::string path; // dispatcher servlet path on the peer
};

// "host:port" or "host:port/servlet/path"; the path defaults to default_path.
chremote::Result<PeerAddress> ParsePeer(std::string_view s, std::string_view default_path);

// Settings of a chremote node. Every key is optional:
//   framework_uid    string, generated when absent
//   listen           "host:port"
//   servlet_path     base path of the dispatcher servlet
//   log_level        trace|debug|info|warn|error|critical|off
//   io_threads       0 = hardware concurrency
//   push_timeout_ms  timeout of discovery pushes
//   peers            ["host:port[/path]", ...] announced to at start-up
struct NodeConfig {
    std::string framework_uid;
    HostPort listen{"0.0.0.0", 8090};
    std::string servlet_path = "/chremote-dispatcher";
    std::string log_level = "info";
    std::size_t io_threads = 0;
    std::chrono::milliseconds push_timeout{5000};
    std::vector<PeerAddress> peers;

    static chremote::Result<NodeConfig> FromConfig(const Config& cfg);
};

} // namespace chremote::config

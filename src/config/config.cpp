#include <chremote/config/config.h>

#include <chremote/core/json.h>
#include <chremote/core/uuid.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace chremote::config {

chremote::Result<Config> Config::LoadFile(std::string path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return chremote::Status(chremote::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return Parse(ss.str());
}

chremote::Result<Config> Config::Parse(std::string_view text) {
    auto r = chjson::parse(text);
    if (r.err) {
        return chremote::Status(chremote::StatusCode::invalid_argument, chremote::json::DescribeParseError(r.err));
    }

    if (!r.doc.root().is_object()) {
        return chremote::Status(chremote::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

bool Config::Has(std::string_view key) const {
    return doc_.root().find(key) != nullptr;
}

chremote::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return chremote::Status(chremote::StatusCode::not_found, "missing key: " + std::string(key));
    }
    if (!v->is_string()) {
        return chremote::Status(chremote::StatusCode::invalid_argument, std::string(key) + " is not a string");
    }
    return std::string(v->as_string_view());
}

chremote::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return chremote::Status(chremote::StatusCode::not_found, "missing key: " + std::string(key));
    }
    if (!v->is_number() || !v->is_int()) {
        return chremote::Status(chremote::StatusCode::invalid_argument, std::string(key) + " is not an int");
    }
    return static_cast<int>(v->as_int());
}

chremote::Result<std::vector<std::string>> Config::GetStringList(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return chremote::Status(chremote::StatusCode::not_found, "missing key: " + std::string(key));
    }
    if (!v->is_array()) {
        return chremote::Status(chremote::StatusCode::invalid_argument, std::string(key) + " is not an array");
    }

    std::vector<std::string> out;
    for (const auto& item : v->as_array()) {
        if (!item.is_string()) {
            return chremote::Status(chremote::StatusCode::invalid_argument, std::string(key) + " must only hold strings");
        }
        out.emplace_back(item.as_string_view());
    }
    return out;
}

chremote::Result<HostPort> ParseHostPort(std::string_view s) {
    auto colon = s.rfind(':');
    if (colon == std::string_view::npos) {
        return chremote::Status(chremote::StatusCode::invalid_argument, "expected host:port, got '" + std::string(s) + "'");
    }

    HostPort out;
    out.host = std::string(s.substr(0, colon));
    auto port_sv = s.substr(colon + 1);
    if (out.host.empty() || port_sv.empty()) {
        return chremote::Status(chremote::StatusCode::invalid_argument, "expected host:port, got '" + std::string(s) + "'");
    }
    int port = std::atoi(std::string(port_sv).c_str());
    if (port <= 0 || port > 65535) {
        return chremote::Status(chremote::StatusCode::invalid_argument, "invalid port in '" + std::string(s) + "'");
    }
    out.port = static_cast<std::uint16_t>(port);
    return out;
}

chremote::Result<PeerAddress> ParsePeer(std::string_view s, std::string_view default_path) {
    std::string_view authority = s;
    std::string path(default_path);
    if (auto slash = s.find('/'); slash != std::string_view::npos) {
        authority = s.substr(0, slash);
        path = std::string(s.substr(slash));
    }

    auto hp = ParseHostPort(authority);
    if (!hp.ok()) {
        return hp.status();
    }
    return PeerAddress{std::move(hp.value().host), hp.value().port, std::move(path)};
}

chremote::Result<NodeConfig> NodeConfig::FromConfig(const Config& cfg) {
    NodeConfig out;

    if (auto uid = cfg.GetString("framework_uid"); uid.ok() && !uid.value().empty()) {
        out.framework_uid = std::move(uid).value();
    } else if (cfg.Has("framework_uid") && !uid.ok()) {
        return uid.status();
    } else {
        out.framework_uid = chremote::NewUuid();
    }

    if (cfg.Has("listen")) {
        auto listen = cfg.GetString("listen");
        if (!listen.ok()) {
            return listen.status();
        }
        auto hp = ParseHostPort(listen.value());
        if (!hp.ok()) {
            return hp.status();
        }
        out.listen = std::move(hp).value();
    }

    if (cfg.Has("servlet_path")) {
        auto path = cfg.GetString("servlet_path");
        if (!path.ok()) {
            return path.status();
        }
        out.servlet_path = std::move(path).value();
    }

    if (cfg.Has("log_level")) {
        auto level = cfg.GetString("log_level");
        if (!level.ok()) {
            return level.status();
        }
        out.log_level = std::move(level).value();
    }

    if (cfg.Has("io_threads")) {
        auto n = cfg.GetInt("io_threads");
        if (!n.ok()) {
            return n.status();
        }
        if (n.value() < 0) {
            return chremote::Status(chremote::StatusCode::invalid_argument, "io_threads must be >= 0");
        }
        out.io_threads = static_cast<std::size_t>(n.value());
    }

    if (cfg.Has("push_timeout_ms")) {
        auto ms = cfg.GetInt("push_timeout_ms");
        if (!ms.ok()) {
            return ms.status();
        }
        if (ms.value() <= 0) {
            return chremote::Status(chremote::StatusCode::invalid_argument, "push_timeout_ms must be > 0");
        }
        out.push_timeout = std::chrono::milliseconds(ms.value());
    }

    if (cfg.Has("peers")) {
        auto peers = cfg.GetStringList("peers");
        if (!peers.ok()) {
            return peers.status();
        }
        for (const auto& p : peers.value()) {
            auto peer = ParsePeer(p, out.servlet_path);
            if (!peer.ok()) {
                return peer.status();
            }
            out.peers.push_back(std::move(peer).value());
        }
    }

    return out;
}

} // namespace chremote::config

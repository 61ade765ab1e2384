#include <chtest.hpp>

#include <chremote/config/config.h>
#include <chremote/core/uuid.h>

#include <cstdio>
#include <fstream>

using chremote::config::Config;
using chremote::config::NodeConfig;

TEST_CASE("Config reads typed values") {
    auto cfg = Config::Parse(R"({"name":"node","threads":4,"peers":["a:1","b:2"]})");
    REQUIRE(cfg.ok());

    REQUIRE(cfg.value().Has("name"));
    REQUIRE(!cfg.value().Has("missing"));
    REQUIRE(cfg.value().GetString("name").value() == "node");
    REQUIRE(cfg.value().GetInt("threads").value() == 4);
    REQUIRE(cfg.value().GetStringList("peers").value() == std::vector<std::string>{"a:1", "b:2"});

    REQUIRE(cfg.value().GetString("missing").status().code() == chremote::StatusCode::not_found);
    REQUIRE(cfg.value().GetInt("name").status().code() == chremote::StatusCode::invalid_argument);
    REQUIRE(cfg.value().GetStringList("name").status().code() == chremote::StatusCode::invalid_argument);
}

TEST_CASE("Config rejects invalid documents") {
    REQUIRE(!Config::Parse("{").ok());
    REQUIRE(!Config::Parse("[1,2]").ok());
    REQUIRE(Config::LoadFile("/nonexistent/chremote.json").status().code() == chremote::StatusCode::not_found);
}

TEST_CASE("Config loads a file") {
    const char* path = "chremote_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"listen":"127.0.0.1:9100"})";
    }
    auto cfg = Config::LoadFile(path);
    std::remove(path);

    REQUIRE(cfg.ok());
    REQUIRE(cfg.value().GetString("listen").value() == "127.0.0.1:9100");
}

TEST_CASE("NodeConfig defaults") {
    auto cfg = Config::Parse("{}");
    REQUIRE(cfg.ok());
    auto node = NodeConfig::FromConfig(cfg.value());
    REQUIRE(node.ok());

    REQUIRE(chremote::IsUuid(node.value().framework_uid));
    REQUIRE(node.value().listen.port == 8090);
    REQUIRE(node.value().servlet_path == "/chremote-dispatcher");
    REQUIRE(node.value().push_timeout == std::chrono::milliseconds(5000));
    REQUIRE(node.value().peers.empty());
}

TEST_CASE("NodeConfig reads every key") {
    auto cfg = Config::Parse(R"({
        "framework_uid": "fw-1",
        "listen": "127.0.0.1:9100",
        "servlet_path": "/dispatch",
        "log_level": "debug",
        "io_threads": 2,
        "push_timeout_ms": 750,
        "peers": ["10.0.0.2:9100", "10.0.0.3:9200/other"]
    })");
    REQUIRE(cfg.ok());
    auto node = NodeConfig::FromConfig(cfg.value());
    REQUIRE(node.ok());

    const auto& n = node.value();
    REQUIRE(n.framework_uid == "fw-1");
    REQUIRE(n.listen.host == "127.0.0.1");
    REQUIRE(n.listen.port == 9100);
    REQUIRE(n.servlet_path == "/dispatch");
    REQUIRE(n.log_level == "debug");
    REQUIRE(n.io_threads == 2);
    REQUIRE(n.push_timeout == std::chrono::milliseconds(750));
    REQUIRE(n.peers.size() == 2);
    REQUIRE(n.peers[0].host == "10.0.0.2");
    REQUIRE(n.peers[0].path == "/dispatch");
    REQUIRE(n.peers[1].port == 9200);
    REQUIRE(n.peers[1].path == "/other");
}

TEST_CASE("NodeConfig rejects bad values") {
    for (const char* text : {R"({"listen":"nohost"})", R"({"listen":"h:70000"})", R"({"io_threads":-1})",
                             R"({"push_timeout_ms":0})", R"({"peers":["bad"]})", R"({"framework_uid":3})"}) {
        auto cfg = Config::Parse(text);
        REQUIRE(cfg.ok());
        auto node = NodeConfig::FromConfig(cfg.value());
        REQUIRE(!node.ok());
        REQUIRE(node.status().code() == chremote::StatusCode::invalid_argument);
    }
}

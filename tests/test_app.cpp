#include <chtest.hpp>

#include <chremote/http/http_client.h>
#include <chremote/http/http_server.h>
#include <chremote/runtime/app.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

TEST_CASE("App runs posted tasks beside a busy single io thread") {
    chremote::AppOptions options;
    options.io_threads = 1;
    options.task_threads = 1;
    options.log_level = "warn";
    chremote::App app(options);

    chremote::http::Router router;
    router.Get("/health", [](const chremote::http::Request&, chremote::http::Response& resp) {
        resp.SetText(200, "ok");
    });
    auto server = std::make_shared<chremote::http::HttpServer>(
        app.Io(), chremote::http::ListenAddress{"127.0.0.1", 0}, std::move(router));
    app.AddServer(server);

    // The task blocks on a request the io thread has to answer.
    std::atomic<int> status{0};
    app.Post([&] {
        auto r = chremote::http::HttpClient::Get(
            "127.0.0.1", std::to_string(server->port()), "/health", std::chrono::milliseconds(2000));
        if (r.ok()) {
            status.store(r.value().status);
        }
        app.Stop();
    });

    REQUIRE(app.Run() == 0);
    REQUIRE(status.load() == 200);
}

TEST_CASE("App drops tasks posted after Stop") {
    chremote::AppOptions options;
    options.io_threads = 1;
    options.log_level = "warn";
    chremote::App app(options);

    std::atomic<int> ran{0};
    app.Post([&] {
        ++ran;
        app.Stop();
    });
    REQUIRE(app.Run() == 0);
    REQUIRE(ran.load() == 1);

    app.Post([&] { ++ran; });
    REQUIRE(ran.load() == 1);
}

#include <chtest.hpp>

#include "fakes.h"

#include <chremote/http/http_server.h>
#include <chremote/http/router.h>
#include <chremote/remote/dispatcher.h>
#include <chremote/remote/import_registry.h>
#include <chremote/remote/registry_servlet.h>
#include <chremote/remote/service_registry.h>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <thread>

namespace beast_http = boost::beast::http;

using chremote::http::Request;
using chremote::http::Response;
using chremote::remote::Dispatcher;
using chremote::remote::ImportRegistry;
using chremote::remote::RegistryServlet;
using chremote::remote::ServiceRegistry;
using chremote::testing::ExportedWith;
using chremote::testing::FakeExporter;

namespace prop = chremote::remote::prop;

namespace {

Request MakeRequest(beast_http::verb method, std::string path, std::string body = {}) {
    Request req;
    req.raw.method(method);
    req.raw.target(path);
    req.raw.body() = std::move(body);
    req.path = std::move(path);
    req.remote_address = "10.0.0.7";
    return req;
}

constexpr std::string_view kOneRecord = R"([{
    "sender": "fw-remote",
    "uid": "uid-1",
    "configurations": ["jsonrpc"],
    "name": "greeter",
    "specifications": ["demo.Hello"],
    "properties": {"exported.configs": ["jsonrpc"], "exported.interfaces": "*", "color": "blue"}
}])";

} // namespace

TEST_CASE("RegistryServlet lists no endpoint as an empty array") {
    Dispatcher d("fw-local");
    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports);
    servlet.BoundTo(8080);

    Response resp;
    servlet.HandleGet(MakeRequest(beast_http::verb::get, "/chremote-dispatcher/endpoints"), resp);

    REQUIRE(resp.status == 200);
    REQUIRE(resp.body == "[]");
    REQUIRE(resp.content_type == "application/json");
}

TEST_CASE("RegistryServlet reports an unknown uid") {
    Dispatcher d("fw-local");
    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports);
    servlet.BoundTo(8080);

    Response resp;
    servlet.HandleGet(MakeRequest(beast_http::verb::get, "/chremote-dispatcher/endpoint/xyz"), resp);

    REQUIRE(resp.status == 404);
    REQUIRE(resp.body == "Unknown UID: xyz");
}

TEST_CASE("RegistryServlet serves local endpoints") {
    ServiceRegistry registry;
    Dispatcher d("fw-local");
    auto exporter = std::make_shared<FakeExporter>(std::vector<std::string>{"jsonrpc"});
    d.AddExporter(exporter);
    d.Start(registry);
    registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    auto uid = d.GetEndpoints().at(0)->uid();

    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports);
    servlet.BoundTo(8080);

    Response one;
    servlet.HandleGet(MakeRequest(beast_http::verb::get, "/chremote-dispatcher/endpoint/" + uid), one);
    REQUIRE(one.status == 200);
    REQUIRE(one.body.find("\"uid\":\"" + uid + "\"") != std::string::npos);
    REQUIRE(one.body.find("\"sender\":\"fw-local\"") != std::string::npos);

    Response all;
    servlet.HandleGet(MakeRequest(beast_http::verb::get, "/chremote-dispatcher/endpoints"), all);
    REQUIRE(all.status == 200);
    REQUIRE(all.body.front() == '[');
    REQUIRE(all.body.find(uid) != std::string::npos);
}

TEST_CASE("RegistryServlet rejects paths it does not serve") {
    Dispatcher d("fw-local");
    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports);
    servlet.BoundTo(8080);

    for (const char* path : {"/chremote-dispatcher", "/chremote-dispatcher/other", "/chremote-dispatcher/endpoint/",
                             "/chremote-dispatcher/endpoint/a/b", "/elsewhere/endpoints"}) {
        Response resp;
        servlet.HandleGet(MakeRequest(beast_http::verb::get, path), resp);
        REQUIRE(resp.status == 404);
        REQUIRE(resp.body == "Unhandled path");
    }

    Response post;
    servlet.HandlePost(MakeRequest(beast_http::verb::post, "/chremote-dispatcher/endpoint/x", "[]"), post);
    REQUIRE(post.status == 404);
}

TEST_CASE("RegistryServlet registers announced endpoints") {
    Dispatcher d("fw-local");
    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports);
    servlet.BoundTo(8080);

    Response resp;
    servlet.HandlePost(MakeRequest(beast_http::verb::post, "/chremote-dispatcher/endpoints", std::string(kOneRecord)), resp);

    REQUIRE(resp.status == 200);
    REQUIRE(imports.size() == 1);

    auto ep = imports.Get("uid-1");
    REQUIRE(ep != nullptr);
    REQUIRE(ep->server_address() == "10.0.0.7");
    REQUIRE(ep->framework_uid() == "fw-remote");
    REQUIRE(ep->name() == "greeter");

    const auto& props = ep->properties();
    REQUIRE(props.find(prop::kExportedConfigs) == props.end());
    REQUIRE(props.find(prop::kExportedInterfaces) == props.end());
    REQUIRE(chremote::remote::GetStringList(props, prop::kImportedConfigs) == std::vector<std::string>{"jsonrpc"});
    REQUIRE(chremote::remote::GetString(props, prop::kFrameworkUid).value() == "fw-remote");
    REQUIRE(props.at(std::string(prop::kImported)).as_bool());
    REQUIRE(chremote::remote::GetString(props, "color").value() == "blue");
}

TEST_CASE("RegistryServlet refuses a malformed payload") {
    Dispatcher d("fw-local");
    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports);
    servlet.BoundTo(8080);

    for (const char* body : {"{not json", "{\"uid\":\"a\"}", "[{\"uid\":\"a\"}]"}) {
        Response resp;
        servlet.HandlePost(MakeRequest(beast_http::verb::post, "/chremote-dispatcher/endpoints", body), resp);
        REQUIRE(resp.status == 400);
        REQUIRE(resp.body.rfind("Invalid endpoints payload: ", 0) == 0);
    }
    REQUIRE(imports.size() == 0);
}

TEST_CASE("RegistryServlet accepts an empty announcement") {
    Dispatcher d("fw-local");
    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports);
    servlet.BoundTo(8080);

    Response resp;
    servlet.HandlePost(MakeRequest(beast_http::verb::post, "/chremote-dispatcher/endpoints", ""), resp);
    REQUIRE(resp.status == 200);
    REQUIRE(imports.size() == 0);
}

TEST_CASE("RegistryServlet is unavailable while unbound") {
    Dispatcher d("fw-local");
    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports);

    REQUIRE(!servlet.active());
    REQUIRE(!servlet.Access().has_value());

    Response resp;
    servlet.HandleGet(MakeRequest(beast_http::verb::get, "/chremote-dispatcher/endpoints"), resp);
    REQUIRE(resp.status == 503);

    servlet.BoundTo(9000);
    servlet.BoundTo(9001);
    REQUIRE(servlet.Access()->first == 9000);
    REQUIRE(servlet.Access()->second == "/chremote-dispatcher");

    servlet.UnboundFrom(9000);
    REQUIRE(servlet.Access()->first == 9001);
    servlet.UnboundFrom(9001);
    REQUIRE(!servlet.active());
}

TEST_CASE("RegistryServlet routes through a router under a custom path") {
    Dispatcher d("fw-local");
    ImportRegistry imports("fw-local");
    auto servlet = std::make_shared<RegistryServlet>(d, imports, "custom/path/");
    servlet->BoundTo(8080);
    REQUIRE(servlet->path() == "/custom/path");

    chremote::http::Router router;
    servlet->Register(router);

    Response get;
    router.Handle(MakeRequest(beast_http::verb::get, "/custom/path/endpoints"), get);
    REQUIRE(get.status == 200);
    REQUIRE(get.body == "[]");

    Response post;
    router.Handle(MakeRequest(beast_http::verb::post, "/custom/path/endpoints", std::string(kOneRecord)), post);
    REQUIRE(post.status == 200);
    REQUIRE(imports.size() == 1);
}

TEST_CASE("RegistryServlet announces local endpoints to a peer over HTTP") {
    // Receiving node, served for real on an ephemeral port.
    Dispatcher peer_dispatcher("fw-peer");
    ImportRegistry peer_imports("fw-peer");
    auto peer_servlet = std::make_shared<RegistryServlet>(peer_dispatcher, peer_imports);

    boost::asio::io_context ioc;
    auto server = std::make_shared<chremote::http::HttpServer>(
        ioc, chremote::http::ListenAddress{"127.0.0.1", 0}, chremote::http::Router{});
    server->AddServlet(peer_servlet);
    server->Start();
    REQUIRE(server->port() != 0);
    REQUIRE(peer_servlet->active());
    std::thread io([&] { ioc.run(); });

    // Announcing node.
    ServiceRegistry registry;
    Dispatcher d("fw-local");
    d.AddExporter(std::make_shared<FakeExporter>(std::vector<std::string>{"jsonrpc"}));
    d.Start(registry);
    registry.Register({"demo.Hello"}, ExportedWith({"jsonrpc"}));
    registry.Register({"demo.World"}, ExportedWith({"jsonrpc"}));

    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports, std::string(chremote::remote::kDefaultServletPath), std::chrono::milliseconds(2000));
    servlet.SendDiscovered("127.0.0.1", server->port(), "/chremote-dispatcher");

    server->Stop();
    ioc.stop();
    io.join();

    REQUIRE(peer_imports.size() == 2);
    for (const auto& ep : peer_imports.List()) {
        REQUIRE(ep->framework_uid() == "fw-local");
        REQUIRE(ep->server_address() == "127.0.0.1");
    }
    REQUIRE(!peer_servlet->active());
}

TEST_CASE("RegistryServlet survives an unreachable peer") {
    Dispatcher d("fw-local");
    ImportRegistry imports("fw-local");
    RegistryServlet servlet(d, imports, std::string(chremote::remote::kDefaultServletPath), std::chrono::milliseconds(300));

    // Port 1 on loopback is refused or times out; either way nothing is thrown.
    servlet.SendDiscovered("127.0.0.1", 1, "/chremote-dispatcher");
    REQUIRE(imports.size() == 0);
}

#include <chremote/config/config.h>
#include <chremote/core/log.h>
#include <chremote/core/uuid.h>
#include <chremote/http/http_server.h>
#include <chremote/http/router.h>
#include <chremote/remote/dispatcher.h>
#include <chremote/remote/import_registry.h>
#include <chremote/remote/registry_servlet.h>
#include <chremote/remote/service_registry.h>
#include <chremote/runtime/app.h>

#include <chjson/chjson.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

namespace remote = chremote::remote;

constexpr std::string_view kDescriptorConfig = "chremote.descriptor";

// Publishes a description of the service without any transport behind it.
// Enough for peers to discover what this node offers.
class DescriptorExporter final : public remote::IExporter, public std::enable_shared_from_this<DescriptorExporter> {
public:
    bool Handles(const std::vector<std::string>& configs) const override {
        for (const auto& c : configs) {
            if (c == kDescriptorConfig) {
                return true;
            }
        }
        return false;
    }

    chremote::Result<remote::ExportEndpointPtr> ExportService(
        const remote::ServiceRefPtr& service, std::string_view name, std::string_view framework_uid) override {
        remote::ExportEndpointPtr endpoint = std::make_shared<const remote::ExportEndpoint>(
            weak_from_this(), service, chremote::NewUuid(), std::string(framework_uid),
            std::vector<std::string>{std::string(kDescriptorConfig)}, std::string(name), service->properties());
        chremote::log::info("descriptor endpoint {} for service {}", endpoint->uid(), service->id());
        return endpoint;
    }

    chremote::Result<remote::ExportEndpointPtr> UpdateExport(
        const remote::ExportEndpointPtr& endpoint, std::string_view new_name, const remote::Properties&) override {
        remote::ExportEndpointPtr updated = endpoint->Renamed(std::string(new_name), endpoint->service()->properties());
        return updated;
    }

    void UnexportService(const remote::ExportEndpointPtr& endpoint) override {
        chremote::log::info("descriptor endpoint {} withdrawn", endpoint->uid());
    }
};

class LoggingListener final : public remote::IEndpointListener {
public:
    void EndpointsAdded(const std::vector<remote::ExportEndpointPtr>& endpoints) override {
        for (const auto& ep : endpoints) {
            chremote::log::info("endpoint added: {} ({})", ep->name(), ep->uid());
        }
    }

    void EndpointUpdated(const remote::ExportEndpointPtr& endpoint, const remote::Properties&) override {
        chremote::log::info("endpoint updated: {} ({})", endpoint->name(), endpoint->uid());
    }

    void EndpointRemoved(const remote::ExportEndpointPtr& endpoint, const remote::Properties*) override {
        chremote::log::info("endpoint removed: {} ({})", endpoint->name(), endpoint->uid());
    }
};

void Usage() {
    std::cerr << "usage: chremote_node [--config file.json] [--listen host:port] [--log level]\n"
                 "                     [--threads n] [--peer host:port[/path]]...\n";
}

} // namespace

int main(int argc, char** argv) {
    chremote::config::NodeConfig node;
    std::vector<std::string> extra_peers;
    std::string listen_override;
    std::string log_override;
    int threads_override = -1;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--config" && i + 1 < argc) {
            auto cfg = chremote::config::Config::LoadFile(argv[++i]);
            if (!cfg.ok()) {
                std::cerr << "Invalid --config: " << cfg.status().ToString() << "\n";
                return 2;
            }
            auto parsed = chremote::config::NodeConfig::FromConfig(cfg.value());
            if (!parsed.ok()) {
                std::cerr << "Invalid --config: " << parsed.status().ToString() << "\n";
                return 2;
            }
            node = std::move(parsed).value();
        } else if (a == "--listen" && i + 1 < argc) {
            listen_override = argv[++i];
        } else if (a == "--log" && i + 1 < argc) {
            log_override = argv[++i];
        } else if (a == "--threads" && i + 1 < argc) {
            threads_override = std::atoi(argv[++i]);
        } else if (a == "--peer" && i + 1 < argc) {
            extra_peers.emplace_back(argv[++i]);
        } else {
            Usage();
            return 2;
        }
    }

    if (node.framework_uid.empty()) {
        node.framework_uid = chremote::NewUuid();
    }
    if (!listen_override.empty()) {
        auto hp = chremote::config::ParseHostPort(listen_override);
        if (!hp.ok()) {
            std::cerr << "Invalid --listen, expected host:port\n";
            return 2;
        }
        node.listen = std::move(hp).value();
    }
    if (!log_override.empty()) {
        node.log_level = log_override;
    }
    if (threads_override >= 0) {
        node.io_threads = static_cast<std::size_t>(threads_override);
    }
    for (const auto& p : extra_peers) {
        auto peer = chremote::config::ParsePeer(p, node.servlet_path);
        if (!peer.ok()) {
            std::cerr << "Invalid --peer: " << peer.status().ToString() << "\n";
            return 2;
        }
        node.peers.push_back(std::move(peer).value());
    }

    chremote::AppOptions opt;
    opt.io_threads = node.io_threads;
    opt.log_level = node.log_level;
    chremote::App app(opt);

    chremote::log::info("framework {} starting", node.framework_uid);

    remote::ServiceRegistry services;
    remote::Dispatcher dispatcher(node.framework_uid);
    dispatcher.AddListener(std::make_shared<LoggingListener>());
    dispatcher.AddExporter(std::make_shared<DescriptorExporter>());
    dispatcher.Start(services);

    remote::ImportRegistry imports(node.framework_uid);
    auto servlet = std::make_shared<remote::RegistryServlet>(dispatcher, imports, node.servlet_path, node.push_timeout);

    chremote::http::Router router;
    router.Get("/health", [](const chremote::http::Request&, chremote::http::Response& resp) {
        resp.SetText(200, "ok");
    });

    auto server = std::make_shared<chremote::http::HttpServer>(
        app.Io(), chremote::http::ListenAddress{node.listen.host, node.listen.port}, std::move(router));
    server->AddServlet(servlet);
    app.AddServer(server);

    services.Register({"demo.Greeter"}, remote::Properties{
        {std::string(remote::prop::kExportedConfigs), chjson::value(std::string(kDescriptorConfig))},
        {std::string(remote::prop::kEndpointName), chjson::value(std::string("greeter"))},
    });

    for (const auto& peer : node.peers) {
        app.Post([servlet, peer] { servlet->SendDiscovered(peer.host, peer.port, peer.path); });
    }

    int rc = app.Run();
    dispatcher.Stop();
    return rc;
}

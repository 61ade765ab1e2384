#include <chremote/remote/endpoint.h>

#include <algorithm>
#include <stdexcept>

namespace chremote::remote {
namespace {

// Interfaces to expose: exported.interfaces restricted to what the service
// provides; "*" or absent means all of them.
std::vector<std::string> ExportedSpecifications(const ServiceReference& service) {
    const auto& provided = service.specifications();
    auto props = service.properties();
    auto requested = GetStringList(props, prop::kExportedInterfaces);
    if (requested.empty() || std::find(requested.begin(), requested.end(), "*") != requested.end()) {
        return provided;
    }

    std::vector<std::string> out;
    for (const auto& spec : requested) {
        if (std::find(provided.begin(), provided.end(), spec) != provided.end()) {
            out.push_back(spec);
        }
    }
    return out;
}

} // namespace

Endpoint::Endpoint(std::string uid,
                   std::string framework_uid,
                   std::vector<std::string> configurations,
                   std::string name,
                   std::vector<std::string> specifications,
                   Properties properties)
    : uid_(std::move(uid)),
      framework_uid_(std::move(framework_uid)),
      configurations_(std::move(configurations)),
      name_(std::move(name)),
      specifications_(std::move(specifications)),
      properties_(std::move(properties)) {
    if (uid_.empty()) {
        throw std::invalid_argument("endpoint uid must not be empty");
    }
    if (configurations_.empty()) {
        throw std::invalid_argument("endpoint " + uid_ + " has no configuration");
    }
}

bool Endpoint::HasConfiguration(std::string_view kind) const {
    return std::find(configurations_.begin(), configurations_.end(), kind) != configurations_.end();
}

ExportEndpoint::ExportEndpoint(std::weak_ptr<IExporter> exporter,
                               ServiceRefPtr service,
                               std::string uid,
                               std::string framework_uid,
                               std::vector<std::string> configurations,
                               std::string name,
                               Properties properties)
    : Endpoint(std::move(uid),
               std::move(framework_uid),
               std::move(configurations),
               std::move(name),
               service ? ExportedSpecifications(*service) : std::vector<std::string>{},
               std::move(properties)),
      exporter_(std::move(exporter)),
      service_(std::move(service)) {
    if (!service_) {
        throw std::invalid_argument("export endpoint " + this->uid() + " has no service");
    }
}

std::shared_ptr<const ExportEndpoint> ExportEndpoint::Renamed(std::string name, Properties properties) const {
    return std::make_shared<const ExportEndpoint>(
        exporter_, service_, uid(), framework_uid(), configurations(), std::move(name), std::move(properties));
}

ImportEndpoint::ImportEndpoint(std::string uid,
                               std::string framework_uid,
                               std::vector<std::string> configurations,
                               std::string name,
                               std::vector<std::string> specifications,
                               Properties properties,
                               std::string server_address)
    : Endpoint(std::move(uid),
               std::move(framework_uid),
               std::move(configurations),
               std::move(name),
               std::move(specifications),
               std::move(properties)),
      server_address_(std::move(server_address)) {}

} // namespace chremote::remote

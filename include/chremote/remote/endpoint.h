#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <chremote/remote/properties.h>
#include <chremote/remote/service.h>

namespace chremote::remote {

class IExporter;

// Description of a remotely reachable service. Immutable once built: an update
// produces a new object carrying the same uid.
class Endpoint {
public:
    // Throws std::invalid_argument on an empty uid or an empty configuration list.
    Endpoint(std::string uid,
             std::string framework_uid,
             std::vector<std::string> configurations,
             std::string name,
             std::vector<std::string> specifications,
             Properties properties);
    virtual ~Endpoint() = default;

    const std::string& uid() const { return uid_; }
    const std::string& framework_uid() const { return framework_uid_; }
    const std::vector<std::string>& configurations() const { return configurations_; }
    const std::string& name() const { return name_; }
    const std::vector<std::string>& specifications() const { return specifications_; }
    const Properties& properties() const { return properties_; }

    bool HasConfiguration(std::string_view kind) const;

private:
    std::string uid_;
    std::string framework_uid_;
    std::vector<std::string> configurations_;
    std::string name_;
    std::vector<std::string> specifications_;
    Properties properties_;
};

// Endpoint created by a local exporter for a local service.
class ExportEndpoint final : public Endpoint {
public:
    ExportEndpoint(std::weak_ptr<IExporter> exporter,
                   ServiceRefPtr service,
                   std::string uid,
                   std::string framework_uid,
                   std::vector<std::string> configurations,
                   std::string name,
                   Properties properties);

    // Null once the exporter is gone.
    std::shared_ptr<IExporter> exporter() const { return exporter_.lock(); }
    const ServiceRefPtr& service() const { return service_; }

    // Copy with a new name and property set, same uid.
    std::shared_ptr<const ExportEndpoint> Renamed(std::string name, Properties properties) const;

private:
    std::weak_ptr<IExporter> exporter_;
    ServiceRefPtr service_;
};

// Endpoint announced by a peer framework.
class ImportEndpoint final : public Endpoint {
public:
    ImportEndpoint(std::string uid,
                   std::string framework_uid,
                   std::vector<std::string> configurations,
                   std::string name,
                   std::vector<std::string> specifications,
                   Properties properties,
                   std::string server_address);

    // Address of the host that announced the endpoint.
    const std::string& server_address() const { return server_address_; }

private:
    std::string server_address_;
};

using EndpointPtr = std::shared_ptr<const Endpoint>;
using ExportEndpointPtr = std::shared_ptr<const ExportEndpoint>;
using ImportEndpointPtr = std::shared_ptr<const ImportEndpoint>;

} // namespace chremote::remote

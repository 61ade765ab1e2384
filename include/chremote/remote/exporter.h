#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <chremote/core/status.h>
#include <chremote/remote/endpoint.h>
#include <chremote/remote/service.h>

namespace chremote::remote {

// Turns local services into endpoints for one or more transport kinds.
//
// ExportService / UpdateExport report their outcome as a tagged result:
//   ok + endpoint      the endpoint was created / updated
//   ok + nullptr       ExportService: the exporter declined the service
//                      UpdateExport: the current endpoint is kept as is
//   needs_reexport     the endpoint can no longer be kept under its current name
//   any other error    creation / update failed
// Exceptions derived from std::exception are treated as failures as well.
class IExporter {
public:
    virtual ~IExporter() = default;

    // True if the exporter serves at least one of the given configurations.
    virtual bool Handles(const std::vector<std::string>& configs) const = 0;

    virtual chremote::Result<ExportEndpointPtr> ExportService(
        const ServiceRefPtr& service, std::string_view name, std::string_view framework_uid) = 0;

    // The returned endpoint must keep the uid of `endpoint`.
    virtual chremote::Result<ExportEndpointPtr> UpdateExport(
        const ExportEndpointPtr& endpoint, std::string_view new_name, const Properties& old_properties) = 0;

    virtual void UnexportService(const ExportEndpointPtr& endpoint) = 0;
};

using ExporterPtr = std::shared_ptr<IExporter>;

} // namespace chremote::remote

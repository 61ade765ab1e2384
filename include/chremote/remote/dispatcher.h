#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <chremote/remote/endpoint_index.h>
#include <chremote/remote/exporter.h>
#include <chremote/remote/listener_hub.h>
#include <chremote/remote/service.h>
#include <chremote/remote/service_registry.h>

namespace chremote::remote {

// Exports local services through the registered exporters and keeps the
// resulting endpoints indexed.
//
// Per service: unexported -> exported -> {updated, unexported}. Update and
// unexport of a service without a record are no-ops.
//
// Exporter calls and listener notifications never run under the index lock.
class Dispatcher final : public IServiceListener {
public:
    explicit Dispatcher(std::string framework_uid);
    ~Dispatcher() override;

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    const std::string& framework_uid() const { return framework_uid_; }

    // Exports the exportable services already in `registry`, then follows its
    // events. The registry must outlive Stop().
    void Start(ServiceRegistry& registry);
    // Returns once registry deliveries running on other threads are done.
    void Stop();
    bool started() const { return started_.load(std::memory_order_acquire); }

    // Thread-safe
    void ServiceChanged(const ServiceEvent& event) override;

    // Thread-safe
    void Export(const ServiceRefPtr& service);
    void Update(const ServiceRefPtr& service, const Properties& previous_properties);
    void Unexport(const ServiceRefPtr& service);

    // Thread-safe. Once started, a new exporter is offered every recorded service.
    void AddExporter(ExporterPtr exporter);
    // Thread-safe. Every endpoint of the exporter is dropped and announced as removed.
    void RemoveExporter(const ExporterPtr& exporter);

    // Thread-safe. A new listener first receives the current endpoints, if any.
    void AddListener(EndpointListenerPtr listener);
    void RemoveListener(const EndpointListenerPtr& listener);

    // Thread-safe
    ExportEndpointPtr GetEndpoint(std::string_view uid) const;
    std::vector<ExportEndpointPtr> GetEndpoints(std::string_view kind = {}, std::string_view name = {}) const;

    // endpoint.name if set and non-empty, otherwise "service_<service.id>".
    static std::string ComputeEndpointName(const Properties& properties);

private:
    std::vector<ExporterPtr> ExportersSnapshot() const;
    bool HasExporter(const ExporterPtr& exporter) const;

    // Asks one exporter for an endpoint and indexes it. nullptr when declined or failed.
    ExportEndpointPtr ExportWith(const ExporterPtr& exporter, const ServiceRefPtr& service, const std::string& name);

    void DropEndpoint(const EndpointIndex::Entry& entry, const Properties* old_properties);

    const std::string framework_uid_;

    EndpointIndex index_;
    ListenerHub listeners_;

    mutable std::mutex exporters_mu_;
    std::vector<ExporterPtr> exporters_;

    std::mutex registry_mu_;
    ServiceRegistry* registry_ = nullptr;
    std::atomic<bool> started_{false};
};

} // namespace chremote::remote

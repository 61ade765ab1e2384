#include <chremote/remote/dispatcher.h>

#include <chremote/core/log.h>

#include <algorithm>
#include <exception>

namespace chremote::remote {
namespace {

std::string Join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) {
            out.append(", ");
        }
        out.append(s);
    }
    return out;
}

// Order and duplicates do not matter when comparing configuration sets.
std::vector<std::string> Normalized(std::vector<std::string> configs) {
    std::sort(configs.begin(), configs.end());
    configs.erase(std::unique(configs.begin(), configs.end()), configs.end());
    return configs;
}

bool ExportsEverywhere(const std::vector<std::string>& configs) {
    return configs.empty() || std::find(configs.begin(), configs.end(), "*") != configs.end();
}

void SafeUnexport(IExporter& exporter, const ExportEndpointPtr& endpoint) {
    try {
        exporter.UnexportService(endpoint);
    } catch (const std::exception& ex) {
        chremote::log::error("error unexporting endpoint {}: {}", endpoint->uid(), ex.what());
    }
}

} // namespace

Dispatcher::Dispatcher(std::string framework_uid) : framework_uid_(std::move(framework_uid)) {}

Dispatcher::~Dispatcher() {
    Stop();
}

void Dispatcher::Start(ServiceRegistry& registry) {
    {
        std::lock_guard<std::mutex> lk(registry_mu_);
        if (registry_ != nullptr) {
            return;
        }
        registry_ = &registry;
    }
    started_.store(true, std::memory_order_release);

    for (const auto& ref : registry.References(IsExportable)) {
        Export(ref);
    }
    registry.AddListener(this, IsExportable);

    chremote::log::info("dispatcher {} started with {} endpoint(s)", framework_uid_, index_.size());
}

void Dispatcher::Stop() {
    std::lock_guard<std::mutex> lk(registry_mu_);
    if (registry_ == nullptr) {
        return;
    }
    registry_->RemoveListener(this);
    registry_ = nullptr;
    started_.store(false, std::memory_order_release);
}

std::string Dispatcher::ComputeEndpointName(const Properties& properties) {
    if (auto name = GetString(properties, prop::kEndpointName); name && !name->empty()) {
        return *name;
    }

    auto it = properties.find(prop::kServiceId);
    if (it != properties.end() && it->second.is_int()) {
        return "service_" + std::to_string(it->second.as_int());
    }
    if (auto id = GetString(properties, prop::kServiceId)) {
        return "service_" + *id;
    }
    return "service_unknown";
}

void Dispatcher::ServiceChanged(const ServiceEvent& event) {
    const auto& ref = event.reference;
    if (!ref) {
        return;
    }

    switch (event.kind) {
        case ServiceEventKind::registered:
            Export(ref);
            break;
        case ServiceEventKind::modified:
            if (!index_.HasRecord(ref->id())) {
                // Newly matching service
                Export(ref);
            } else {
                Update(ref, event.previous_properties ? *event.previous_properties : Properties{});
            }
            break;
        case ServiceEventKind::modified_endmatch:
        case ServiceEventKind::unregistering:
            if (index_.HasRecord(ref->id())) {
                Unexport(ref);
            }
            break;
    }
}

std::vector<ExporterPtr> Dispatcher::ExportersSnapshot() const {
    std::lock_guard<std::mutex> lk(exporters_mu_);
    return exporters_;
}

ExportEndpointPtr Dispatcher::ExportWith(const ExporterPtr& exporter, const ServiceRefPtr& service, const std::string& name) {
    ExportEndpointPtr endpoint;
    try {
        auto r = exporter->ExportService(service, name, framework_uid_);
        if (!r.ok()) {
            chremote::log::error("error exporting service {}: {}", service->id(), r.status().ToString());
            return nullptr;
        }
        endpoint = std::move(r).value();
    } catch (const std::exception& ex) {
        chremote::log::error("error exporting service {}: {}", service->id(), ex.what());
        return nullptr;
    }

    if (!endpoint) {
        chremote::log::debug("exporter declined service {}", service->id());
        return nullptr;
    }
    if (endpoint->service()->id() != service->id()) {
        chremote::log::error("exporter returned endpoint {} for service {} instead of {}",
            endpoint->uid(), endpoint->service()->id(), service->id());
        SafeUnexport(*exporter, endpoint);
        return nullptr;
    }

    auto st = index_.Put(endpoint, exporter);
    if (!st.ok()) {
        chremote::log::error("cannot store endpoint {}: {}", endpoint->uid(), st.ToString());
        SafeUnexport(*exporter, endpoint);
        return nullptr;
    }

    // Checked after Put: RemoveExporter erases the exporter before it collects
    // the exporter's endpoints.
    if (!HasExporter(exporter)) {
        chremote::log::warn("exporter withdrawn while exporting service {}, dropping endpoint {}",
            service->id(), endpoint->uid());
        if (index_.Remove(endpoint->uid())) {
            SafeUnexport(*exporter, endpoint);
        }
        return nullptr;
    }
    return endpoint;
}

bool Dispatcher::HasExporter(const ExporterPtr& exporter) const {
    std::lock_guard<std::mutex> lk(exporters_mu_);
    return std::find(exporters_.begin(), exporters_.end(), exporter) != exporters_.end();
}

void Dispatcher::Export(const ServiceRefPtr& service) {
    if (!service) {
        return;
    }
    index_.EnsureRecord(service);

    auto exporters = ExportersSnapshot();
    if (exporters.empty()) {
        chremote::log::warn("no exporter available yet for service {}", service->id());
        return;
    }

    auto props = service->properties();
    auto configs = GetStringList(props, prop::kExportedConfigs);
    if (!ExportsEverywhere(configs)) {
        exporters.erase(std::remove_if(exporters.begin(), exporters.end(),
            [&](const ExporterPtr& e) { return !e->Handles(configs); }), exporters.end());
    }
    if (exporters.empty()) {
        chremote::log::warn("no exporter for configurations [{}] of service {}", Join(configs), service->id());
        return;
    }

    auto name = ComputeEndpointName(props);

    std::vector<ExportEndpointPtr> created;
    for (const auto& exporter : exporters) {
        if (auto endpoint = ExportWith(exporter, service, name)) {
            created.push_back(std::move(endpoint));
        }
    }

    if (created.empty()) {
        chremote::log::warn("no endpoint created for service {}", service->id());
        return;
    }

    chremote::log::info("service {} exported as {} ({} endpoint(s))", service->id(), name, created.size());
    listeners_.EndpointsAdded(created);
}

void Dispatcher::Update(const ServiceRefPtr& service, const Properties& previous_properties) {
    if (!service || !index_.HasRecord(service->id())) {
        return;
    }

    auto current = service->properties();
    if (Normalized(GetStringList(previous_properties, prop::kExportedConfigs))
        != Normalized(GetStringList(current, prop::kExportedConfigs))) {
        chremote::log::info("exported configurations of service {} changed, exporting it again", service->id());
        Unexport(service);
        Export(service);
        return;
    }

    auto new_name = ComputeEndpointName(current);

    for (const auto& uid : index_.RecordFor(service->id())) {
        auto entry = index_.Lookup(uid);
        if (!entry) {
            chremote::log::warn("no exporter for endpoint {} of service {}, dropping it", uid, service->id());
            index_.DropFromRecord(service->id(), uid);
            continue;
        }

        std::string failure;
        ExportEndpointPtr updated;
        try {
            auto r = entry->exporter->UpdateExport(entry->endpoint, new_name, previous_properties);
            if (r.ok()) {
                updated = std::move(r).value();
            } else {
                failure = r.status().ToString();
            }
        } catch (const std::exception& ex) {
            failure = ex.what();
        }
        if (failure.empty() && updated && updated->uid() != uid) {
            failure = "exporter changed the endpoint uid to " + updated->uid();
        }

        if (!failure.empty()) {
            chremote::log::error("error updating endpoint {}: {}", uid, failure);
            if (auto removed = index_.Remove(uid)) {
                DropEndpoint(*removed, &previous_properties);
            }
            continue;
        }

        if (updated) {
            auto st = index_.Replace(updated);
            if (!st.ok()) {
                chremote::log::warn("endpoint {} disappeared during its update", uid);
                continue;
            }
        } else {
            updated = entry->endpoint;
        }
        listeners_.EndpointUpdated(updated, previous_properties);
    }
}

void Dispatcher::Unexport(const ServiceRefPtr& service) {
    if (!service) {
        return;
    }

    auto uids = index_.PopRecord(service->id());
    if (!uids) {
        return;
    }

    for (const auto& uid : *uids) {
        auto entry = index_.Remove(uid);
        if (!entry) {
            chremote::log::warn("trying to remove a lost endpoint ({})", uid);
            continue;
        }
        DropEndpoint(*entry, nullptr);
    }
    chremote::log::info("service {} unexported", service->id());
}

void Dispatcher::DropEndpoint(const EndpointIndex::Entry& entry, const Properties* old_properties) {
    SafeUnexport(*entry.exporter, entry.endpoint);
    listeners_.EndpointRemoved(entry.endpoint, old_properties);
}

void Dispatcher::AddExporter(ExporterPtr exporter) {
    if (!exporter) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(exporters_mu_);
        if (std::find(exporters_.begin(), exporters_.end(), exporter) != exporters_.end()) {
            return;
        }
        exporters_.push_back(exporter);
    }

    if (!started()) {
        return;
    }

    for (const auto& service : index_.RecordedServices()) {
        auto props = service->properties();
        auto configs = GetStringList(props, prop::kExportedConfigs);
        if (!ExportsEverywhere(configs) && !exporter->Handles(configs)) {
            continue;
        }

        if (auto endpoint = ExportWith(exporter, service, ComputeEndpointName(props))) {
            listeners_.EndpointsAdded({endpoint});
        }
    }
}

void Dispatcher::RemoveExporter(const ExporterPtr& exporter) {
    {
        std::lock_guard<std::mutex> lk(exporters_mu_);
        exporters_.erase(std::remove(exporters_.begin(), exporters_.end(), exporter), exporters_.end());
    }

    // The withdrawn exporter is not called back: it releases its own resources.
    for (const auto& uid : index_.OwnedBy(exporter.get())) {
        if (auto entry = index_.Remove(uid)) {
            listeners_.EndpointRemoved(entry->endpoint, nullptr);
        }
    }
}

void Dispatcher::AddListener(EndpointListenerPtr listener) {
    if (!listener) {
        return;
    }
    listeners_.Add(listener);

    auto current = index_.List();
    if (!current.empty()) {
        ListenerHub::NotifyAdded(*listener, current);
    }
}

void Dispatcher::RemoveListener(const EndpointListenerPtr& listener) {
    listeners_.Remove(listener);
}

ExportEndpointPtr Dispatcher::GetEndpoint(std::string_view uid) const {
    return index_.Get(uid);
}

std::vector<ExportEndpointPtr> Dispatcher::GetEndpoints(std::string_view kind, std::string_view name) const {
    return index_.List(kind, name);
}

} // namespace chremote::remote

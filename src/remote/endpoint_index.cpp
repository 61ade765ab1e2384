#include <chremote/remote/endpoint_index.h>

namespace chremote::remote {

chremote::Status EndpointIndex::Put(ExportEndpointPtr endpoint, ExporterPtr exporter) {
    if (!endpoint) {
        return chremote::Status(chremote::StatusCode::invalid_argument, "null endpoint");
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (endpoints_.find(endpoint->uid()) != endpoints_.end()) {
        return chremote::Status(chremote::StatusCode::already_exists, "duplicate endpoint uid " + endpoint->uid());
    }

    // The record is opened by EnsureRecord; once popped, the service is gone.
    auto rec = records_.find(endpoint->service()->id());
    if (rec == records_.end()) {
        return chremote::Status(chremote::StatusCode::not_found,
            "service " + std::to_string(endpoint->service()->id()) + " is no longer exported");
    }
    rec->second.uids.insert(endpoint->uid());

    exporters_.emplace(endpoint->uid(), std::move(exporter));
    auto uid = endpoint->uid();
    endpoints_.emplace(std::move(uid), std::move(endpoint));
    return chremote::Status::Ok();
}

ExportEndpointPtr EndpointIndex::Get(std::string_view uid) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = endpoints_.find(std::string(uid));
    if (it == endpoints_.end()) {
        return nullptr;
    }
    return it->second;
}

std::optional<EndpointIndex::Entry> EndpointIndex::Lookup(std::string_view uid) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = std::string(uid);
    auto ep = endpoints_.find(key);
    auto ex = exporters_.find(key);
    if (ep == endpoints_.end() || ex == exporters_.end()) {
        return std::nullopt;
    }
    return Entry{ep->second, ex->second};
}

std::vector<ExportEndpointPtr> EndpointIndex::List(std::string_view kind, std::string_view name) const {
    std::vector<ExportEndpointPtr> out;
    std::lock_guard<std::mutex> lk(mu_);
    out.reserve(endpoints_.size());
    for (const auto& kv : endpoints_) {
        const auto& ep = kv.second;
        if (!name.empty() && ep->name() != name) {
            continue;
        }
        if (!kind.empty() && !ep->HasConfiguration(kind)) {
            continue;
        }
        out.push_back(ep);
    }
    return out;
}

std::optional<EndpointIndex::Entry> EndpointIndex::Remove(std::string_view uid) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = std::string(uid);
    auto ep = endpoints_.find(key);
    auto ex = exporters_.find(key);
    if (ep == endpoints_.end() || ex == exporters_.end()) {
        // Half-present entries are dropped so the maps converge.
        if (ep != endpoints_.end()) {
            endpoints_.erase(ep);
        }
        if (ex != exporters_.end()) {
            exporters_.erase(ex);
        }
        return std::nullopt;
    }

    Entry entry{std::move(ep->second), std::move(ex->second)};
    endpoints_.erase(ep);
    exporters_.erase(ex);

    auto rec = records_.find(entry.endpoint->service()->id());
    if (rec != records_.end()) {
        rec->second.uids.erase(key);
    }
    return entry;
}

chremote::Status EndpointIndex::Replace(ExportEndpointPtr endpoint) {
    if (!endpoint) {
        return chremote::Status(chremote::StatusCode::invalid_argument, "null endpoint");
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto it = endpoints_.find(endpoint->uid());
    if (it == endpoints_.end()) {
        return chremote::Status(chremote::StatusCode::not_found, "unknown endpoint uid " + endpoint->uid());
    }
    it->second = std::move(endpoint);
    return chremote::Status::Ok();
}

std::vector<ServiceRefPtr> EndpointIndex::RecordedServices() const {
    std::vector<ServiceRefPtr> out;
    std::lock_guard<std::mutex> lk(mu_);
    out.reserve(records_.size());
    for (const auto& kv : records_) {
        out.push_back(kv.second.service);
    }
    return out;
}

bool EndpointIndex::HasRecord(std::int64_t service_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return records_.find(service_id) != records_.end();
}

void EndpointIndex::EnsureRecord(const ServiceRefPtr& service) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& record = records_[service->id()];
    if (!record.service) {
        record.service = service;
    }
}

std::set<std::string> EndpointIndex::RecordFor(std::int64_t service_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(service_id);
    if (it == records_.end()) {
        return {};
    }
    return it->second.uids;
}

void EndpointIndex::DropFromRecord(std::int64_t service_id, std::string_view uid) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(service_id);
    if (it != records_.end()) {
        it->second.uids.erase(std::string(uid));
    }
}

std::optional<std::set<std::string>> EndpointIndex::PopRecord(std::int64_t service_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(service_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    auto uids = std::move(it->second.uids);
    records_.erase(it);
    return uids;
}

std::vector<std::string> EndpointIndex::OwnedBy(const IExporter* exporter) const {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : exporters_) {
        if (kv.second.get() == exporter) {
            out.push_back(kv.first);
        }
    }
    return out;
}

std::size_t EndpointIndex::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return endpoints_.size();
}

} // namespace chremote::remote

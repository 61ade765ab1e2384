#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <chremote/core/status.h>
#include <chremote/remote/endpoint.h>
#include <chremote/remote/exporter.h>

namespace chremote::remote {

// Exported endpoints and their cross references:
//   uid -> endpoint, uid -> exporter, service id -> set(uid).
// Every method runs under one mutex and returns copies, so the three maps are
// always observed consistent.
class EndpointIndex {
public:
    struct Entry {
        ExportEndpointPtr endpoint;
        ExporterPtr exporter;
    };

    // Thread-safe. already_exists if the uid is known, not_found if the
    // endpoint's service has no record. The uid is added to that record.
    chremote::Status Put(ExportEndpointPtr endpoint, ExporterPtr exporter);

    // Thread-safe. nullptr if unknown.
    ExportEndpointPtr Get(std::string_view uid) const;

    // Thread-safe
    std::optional<Entry> Lookup(std::string_view uid) const;

    // Thread-safe. Empty filters match everything.
    std::vector<ExportEndpointPtr> List(std::string_view kind = {}, std::string_view name = {}) const;

    // Thread-safe. Removes the uid from every map, its service record included.
    std::optional<Entry> Remove(std::string_view uid);

    // Thread-safe. Swaps in an updated endpoint with the same uid.
    chremote::Status Replace(ExportEndpointPtr endpoint);

    // Thread-safe. Services with a record, in id order.
    std::vector<ServiceRefPtr> RecordedServices() const;

    // Thread-safe
    bool HasRecord(std::int64_t service_id) const;
    void EnsureRecord(const ServiceRefPtr& service);
    std::set<std::string> RecordFor(std::int64_t service_id) const;

    // Thread-safe. Drops one stale uid from a record; the endpoint maps are not touched.
    void DropFromRecord(std::int64_t service_id, std::string_view uid);

    // Thread-safe. Removes the whole record; nullopt if there was none.
    std::optional<std::set<std::string>> PopRecord(std::int64_t service_id);

    // Thread-safe. UIDs created by the given exporter.
    std::vector<std::string> OwnedBy(const IExporter* exporter) const;

    // Thread-safe
    std::size_t size() const;
    bool empty() const { return size() == 0; }

private:
    struct Record {
        ServiceRefPtr service;
        std::set<std::string> uids;
    };

    mutable std::mutex mu_;
    std::unordered_map<std::string, ExportEndpointPtr> endpoints_;
    std::unordered_map<std::string, ExporterPtr> exporters_;
    std::map<std::int64_t, Record> records_;
};

} // namespace chremote::remote

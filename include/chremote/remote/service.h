#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <chremote/remote/properties.h>

namespace chremote::remote {

class ServiceRegistry;

// Handle on a service registered in the local ServiceRegistry. Properties are
// owned by the registry; readers get copies.
class ServiceReference {
public:
    ServiceReference(std::int64_t id, std::vector<std::string> specifications, Properties properties);

    ServiceReference(const ServiceReference&) = delete;
    ServiceReference& operator=(const ServiceReference&) = delete;

    std::int64_t id() const { return id_; }
    const std::vector<std::string>& specifications() const { return specifications_; }

    // Thread-safe
    Properties properties() const;
    std::optional<chjson::value> property(std::string_view key) const;

private:
    friend class ServiceRegistry;

    // Returns the previous property set. Keeps service.id and objectClass.
    Properties ReplaceProperties(Properties properties);

    const std::int64_t id_;
    const std::vector<std::string> specifications_;

    mutable std::mutex mu_;
    Properties properties_;
};

using ServiceRefPtr = std::shared_ptr<const ServiceReference>;

enum class ServiceEventKind {
    registered,
    modified,
    modified_endmatch,
    unregistering,
};

std::string_view ServiceEventKindName(ServiceEventKind kind);

struct ServiceEvent {
    ServiceEventKind kind = ServiceEventKind::registered;
    ServiceRefPtr reference;
    // Set for modified / modified_endmatch.
    std::optional<Properties> previous_properties;
};

class IServiceListener {
public:
    virtual ~IServiceListener() = default;

    virtual void ServiceChanged(const ServiceEvent& event) = 0;
};

} // namespace chremote::remote

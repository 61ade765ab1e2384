#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <chremote/core/status.h>
#include <chremote/remote/service.h>

namespace chremote::remote {

using ServiceFilter = std::function<bool(const Properties&)>;

// Matches services carrying exported.configs or exported.interfaces.
bool IsExportable(const Properties& props);

// In-process service registry raising lifecycle events to filtered listeners.
// Events are delivered on the calling thread, outside the registry lock.
class ServiceRegistry {
public:
    // Thread-safe. service.id and objectClass are set by the registry.
    ServiceRefPtr Register(std::vector<std::string> specifications, Properties properties);

    // Thread-safe. Listeners whose filter matches the new properties get
    // `modified`; those that only matched the old ones get `modified_endmatch`.
    chremote::Status SetProperties(const ServiceRefPtr& ref, Properties properties);

    // Thread-safe
    chremote::Status Unregister(const ServiceRefPtr& ref);

    // Thread-safe. An empty filter matches everything.
    std::vector<ServiceRefPtr> References(const ServiceFilter& filter = {}) const;

    // Thread-safe. The listener is not owned and must be removed before it dies.
    void AddListener(IServiceListener* listener, ServiceFilter filter = {});

    // Thread-safe. Once it returns, the listener gets no new event and every
    // delivery running on another thread has finished. May be called from
    // within the listener itself.
    void RemoveListener(IServiceListener* listener);

private:
    struct ListenerSlot;
    using SlotPtr = std::shared_ptr<ListenerSlot>;

    std::vector<SlotPtr> ListenersSnapshot() const;
    static void Deliver(ListenerSlot& slot, const ServiceEvent& event);

    mutable std::mutex mu_;
    std::int64_t next_id_ = 1;
    std::map<std::int64_t, std::shared_ptr<ServiceReference>> services_;
    std::vector<SlotPtr> listeners_;
};

} // namespace chremote::remote

#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include <chremote/remote/listener.h>

namespace chremote::remote {

// Fan-out of endpoint events. Each broadcast walks a snapshot of the listeners
// taken when it starts; a listener throwing std::exception is logged and the
// others still get the event.
class ListenerHub {
public:
    // Thread-safe. Adding the same listener twice is a no-op.
    void Add(EndpointListenerPtr listener);
    // Thread-safe
    void Remove(const EndpointListenerPtr& listener);

    // Thread-safe
    std::size_t size() const;

    void EndpointsAdded(const std::vector<ExportEndpointPtr>& endpoints) const;
    void EndpointUpdated(const ExportEndpointPtr& endpoint, const Properties& old_properties) const;
    void EndpointRemoved(const ExportEndpointPtr& endpoint, const Properties* old_properties) const;

    // Delivers EndpointsAdded to a single listener with the same isolation.
    static void NotifyAdded(IEndpointListener& listener, const std::vector<ExportEndpointPtr>& endpoints);

private:
    std::vector<EndpointListenerPtr> Snapshot() const;

    mutable std::mutex mu_;
    std::vector<EndpointListenerPtr> listeners_;
};

} // namespace chremote::remote

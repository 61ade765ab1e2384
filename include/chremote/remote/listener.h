#pragma once

#include <memory>
#include <vector>

#include <chremote/remote/endpoint.h>

namespace chremote::remote {

// Observer of exported endpoints. Override only what is needed.
// Calls never happen while the dispatcher holds its index lock, so a listener
// may call back into the dispatcher. Calls must not block for long.
class IEndpointListener {
public:
    virtual ~IEndpointListener() = default;

    virtual void EndpointsAdded(const std::vector<ExportEndpointPtr>& endpoints) { (void)endpoints; }

    virtual void EndpointUpdated(const ExportEndpointPtr& endpoint, const Properties& old_properties) {
        (void)endpoint;
        (void)old_properties;
    }

    // old_properties is set when the removal follows a failed update.
    virtual void EndpointRemoved(const ExportEndpointPtr& endpoint, const Properties* old_properties) {
        (void)endpoint;
        (void)old_properties;
    }
};

using EndpointListenerPtr = std::shared_ptr<IEndpointListener>;

} // namespace chremote::remote

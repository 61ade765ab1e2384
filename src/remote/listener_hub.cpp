#include <chremote/remote/listener_hub.h>

#include <chremote/core/log.h>

#include <algorithm>
#include <exception>

namespace chremote::remote {

void ListenerHub::Add(EndpointListenerPtr listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lk(mu_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(std::move(listener));
    }
}

void ListenerHub::Remove(const EndpointListenerPtr& listener) {
    std::lock_guard<std::mutex> lk(mu_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

std::size_t ListenerHub::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return listeners_.size();
}

std::vector<EndpointListenerPtr> ListenerHub::Snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return listeners_;
}

void ListenerHub::NotifyAdded(IEndpointListener& listener, const std::vector<ExportEndpointPtr>& endpoints) {
    try {
        listener.EndpointsAdded(endpoints);
    } catch (const std::exception& ex) {
        chremote::log::error("error notifying listener of {} new endpoint(s): {}", endpoints.size(), ex.what());
    }
}

void ListenerHub::EndpointsAdded(const std::vector<ExportEndpointPtr>& endpoints) const {
    for (const auto& listener : Snapshot()) {
        NotifyAdded(*listener, endpoints);
    }
}

void ListenerHub::EndpointUpdated(const ExportEndpointPtr& endpoint, const Properties& old_properties) const {
    for (const auto& listener : Snapshot()) {
        try {
            listener->EndpointUpdated(endpoint, old_properties);
        } catch (const std::exception& ex) {
            chremote::log::error("error notifying listener of updated endpoint {}: {}", endpoint->uid(), ex.what());
        }
    }
}

void ListenerHub::EndpointRemoved(const ExportEndpointPtr& endpoint, const Properties* old_properties) const {
    for (const auto& listener : Snapshot()) {
        try {
            listener->EndpointRemoved(endpoint, old_properties);
        } catch (const std::exception& ex) {
            chremote::log::error("error notifying listener of removed endpoint {}: {}", endpoint->uid(), ex.what());
        }
    }
}

} // namespace chremote::remote

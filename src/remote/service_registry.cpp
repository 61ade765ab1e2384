#include <chremote/remote/service_registry.h>

#include <chremote/core/log.h>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <iterator>

namespace chremote::remote {

struct ServiceRegistry::ListenerSlot {
    IServiceListener* listener = nullptr;
    ServiceFilter filter;

    std::mutex mu;
    std::condition_variable idle;
    int in_flight = 0;
    bool removed = false;
};

namespace {

bool Matches(const ServiceFilter& filter, const Properties& props) {
    return !filter || filter(props);
}

// Slots whose listener is being called on this thread, innermost last.
thread_local std::vector<const void*> t_delivering;

} // namespace

std::string_view ServiceEventKindName(ServiceEventKind kind) {
    switch (kind) {
        case ServiceEventKind::registered: return "REGISTERED";
        case ServiceEventKind::modified: return "MODIFIED";
        case ServiceEventKind::modified_endmatch: return "MODIFIED_ENDMATCH";
        case ServiceEventKind::unregistering: return "UNREGISTERING";
    }
    return "UNKNOWN";
}

ServiceReference::ServiceReference(std::int64_t id, std::vector<std::string> specifications, Properties properties)
    : id_(id), specifications_(std::move(specifications)), properties_(std::move(properties)) {
    properties_[std::string(prop::kServiceId)] = chjson::value::integer(id_);
    properties_[std::string(prop::kObjectClass)] = MakeStringArray(specifications_);
}

Properties ServiceReference::properties() const {
    std::lock_guard<std::mutex> lk(mu_);
    return properties_;
}

std::optional<chjson::value> ServiceReference::property(std::string_view key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Properties ServiceReference::ReplaceProperties(Properties properties) {
    properties[std::string(prop::kServiceId)] = chjson::value::integer(id_);
    properties[std::string(prop::kObjectClass)] = MakeStringArray(specifications_);

    std::lock_guard<std::mutex> lk(mu_);
    std::swap(properties_, properties);
    return properties;
}

bool IsExportable(const Properties& props) {
    return props.find(prop::kExportedConfigs) != props.end()
        || props.find(prop::kExportedInterfaces) != props.end();
}

ServiceRefPtr ServiceRegistry::Register(std::vector<std::string> specifications, Properties properties) {
    std::shared_ptr<ServiceReference> ref;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto id = next_id_++;
        ref = std::make_shared<ServiceReference>(id, std::move(specifications), std::move(properties));
        services_.emplace(id, ref);
    }

    ServiceEvent event{ServiceEventKind::registered, ref, std::nullopt};
    auto props = ref->properties();
    for (const auto& slot : ListenersSnapshot()) {
        if (Matches(slot->filter, props)) {
            Deliver(*slot, event);
        }
    }
    return ref;
}

chremote::Status ServiceRegistry::SetProperties(const ServiceRefPtr& ref, Properties properties) {
    std::shared_ptr<ServiceReference> svc;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = ref ? services_.find(ref->id()) : services_.end();
        if (it == services_.end()) {
            return chremote::Status(chremote::StatusCode::not_found, "service is not registered");
        }
        svc = it->second;
    }

    auto previous = svc->ReplaceProperties(std::move(properties));
    auto current = svc->properties();

    for (const auto& slot : ListenersSnapshot()) {
        if (Matches(slot->filter, current)) {
            Deliver(*slot, ServiceEvent{ServiceEventKind::modified, svc, previous});
        } else if (Matches(slot->filter, previous)) {
            Deliver(*slot, ServiceEvent{ServiceEventKind::modified_endmatch, svc, previous});
        }
    }
    return chremote::Status::Ok();
}

chremote::Status ServiceRegistry::Unregister(const ServiceRefPtr& ref) {
    std::shared_ptr<ServiceReference> svc;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = ref ? services_.find(ref->id()) : services_.end();
        if (it == services_.end()) {
            return chremote::Status(chremote::StatusCode::not_found, "service is not registered");
        }
        svc = std::move(it->second);
        services_.erase(it);
    }

    ServiceEvent event{ServiceEventKind::unregistering, svc, std::nullopt};
    auto props = svc->properties();
    for (const auto& slot : ListenersSnapshot()) {
        if (Matches(slot->filter, props)) {
            Deliver(*slot, event);
        }
    }
    return chremote::Status::Ok();
}

std::vector<ServiceRefPtr> ServiceRegistry::References(const ServiceFilter& filter) const {
    std::vector<std::shared_ptr<ServiceReference>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        all.reserve(services_.size());
        for (const auto& kv : services_) {
            all.push_back(kv.second);
        }
    }

    std::vector<ServiceRefPtr> out;
    for (auto& svc : all) {
        if (Matches(filter, svc->properties())) {
            out.push_back(std::move(svc));
        }
    }
    return out;
}

void ServiceRegistry::AddListener(IServiceListener* listener, ServiceFilter filter) {
    auto slot = std::make_shared<ListenerSlot>();
    slot->listener = listener;
    slot->filter = std::move(filter);

    std::lock_guard<std::mutex> lk(mu_);
    listeners_.push_back(std::move(slot));
}

void ServiceRegistry::RemoveListener(IServiceListener* listener) {
    std::vector<SlotPtr> removed;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = std::stable_partition(listeners_.begin(), listeners_.end(),
            [&](const SlotPtr& s) { return s->listener != listener; });
        removed.assign(std::make_move_iterator(it), std::make_move_iterator(listeners_.end()));
        listeners_.erase(it, listeners_.end());
    }

    for (const auto& slot : removed) {
        // Deliveries on this thread are waiting on us; only wait for the others.
        auto own = std::count(t_delivering.begin(), t_delivering.end(), slot.get());

        std::unique_lock<std::mutex> lk(slot->mu);
        slot->removed = true;
        slot->idle.wait(lk, [&] { return slot->in_flight <= own; });
    }
}

std::vector<ServiceRegistry::SlotPtr> ServiceRegistry::ListenersSnapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return listeners_;
}

void ServiceRegistry::Deliver(ListenerSlot& slot, const ServiceEvent& event) {
    {
        std::lock_guard<std::mutex> lk(slot.mu);
        if (slot.removed) {
            return;
        }
        ++slot.in_flight;
    }

    struct Leave {
        ListenerSlot& slot;
        ~Leave() {
            t_delivering.pop_back();
            {
                std::lock_guard<std::mutex> lk(slot.mu);
                --slot.in_flight;
            }
            slot.idle.notify_all();
        }
    };
    t_delivering.push_back(&slot);
    Leave leave{slot};

    try {
        slot.listener->ServiceChanged(event);
    } catch (const std::exception& ex) {
        chremote::log::error("service listener failed on {} of service {}: {}",
            ServiceEventKindName(event.kind), event.reference->id(), ex.what());
    }
}

} // namespace chremote::remote

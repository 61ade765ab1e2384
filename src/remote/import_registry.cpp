#include <chremote/remote/import_registry.h>

#include <chremote/core/log.h>

namespace chremote::remote {

ImportRegistry::ImportRegistry(std::string local_framework_uid)
    : local_framework_uid_(std::move(local_framework_uid)) {}

bool ImportRegistry::Add(ImportEndpointPtr endpoint) {
    if (!endpoint) {
        return false;
    }
    if (endpoint->framework_uid() == local_framework_uid_) {
        chremote::log::debug("ignoring endpoint {} announced by the local framework", endpoint->uid());
        return false;
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto [it, inserted] = endpoints_.emplace(endpoint->uid(), endpoint);
    if (!inserted) {
        chremote::log::debug("endpoint {} from {} already imported", endpoint->uid(), endpoint->server_address());
        return false;
    }
    chremote::log::info("imported endpoint {} ({}) from {}", endpoint->uid(), endpoint->name(), endpoint->server_address());
    return true;
}

ImportEndpointPtr ImportRegistry::Remove(std::string_view uid) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = endpoints_.find(uid);
    if (it == endpoints_.end()) {
        return nullptr;
    }
    auto endpoint = std::move(it->second);
    endpoints_.erase(it);
    return endpoint;
}

ImportEndpointPtr ImportRegistry::Get(std::string_view uid) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = endpoints_.find(uid);
    if (it == endpoints_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<ImportEndpointPtr> ImportRegistry::List() const {
    std::vector<ImportEndpointPtr> out;
    std::lock_guard<std::mutex> lk(mu_);
    out.reserve(endpoints_.size());
    for (const auto& kv : endpoints_) {
        out.push_back(kv.second);
    }
    return out;
}

std::vector<ImportEndpointPtr> ImportRegistry::LostFramework(std::string_view framework_uid) {
    std::vector<ImportEndpointPtr> lost;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = endpoints_.begin(); it != endpoints_.end();) {
        if (it->second->framework_uid() == framework_uid) {
            lost.push_back(std::move(it->second));
            it = endpoints_.erase(it);
        } else {
            ++it;
        }
    }
    return lost;
}

std::size_t ImportRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return endpoints_.size();
}

} // namespace chremote::remote

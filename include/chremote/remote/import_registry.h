#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <chremote/remote/endpoint.h>

namespace chremote::remote {

// Receives endpoints announced by peer frameworks.
class IImportRegistry {
public:
    virtual ~IImportRegistry() = default;

    // Thread-safe. False if the endpoint was not accepted.
    virtual bool Add(ImportEndpointPtr endpoint) = 0;
};

// Imported endpoints, keyed by uid.
class ImportRegistry final : public IImportRegistry {
public:
    // Endpoints coming back from the local framework are refused.
    explicit ImportRegistry(std::string local_framework_uid);

    bool Add(ImportEndpointPtr endpoint) override;

    // Thread-safe. nullptr if unknown.
    ImportEndpointPtr Remove(std::string_view uid);
    ImportEndpointPtr Get(std::string_view uid) const;
    std::vector<ImportEndpointPtr> List() const;

    // Thread-safe. Drops every endpoint of a framework that went away.
    std::vector<ImportEndpointPtr> LostFramework(std::string_view framework_uid);

    std::size_t size() const;

private:
    const std::string local_framework_uid_;

    mutable std::mutex mu_;
    std::map<std::string, ImportEndpointPtr, std::less<>> endpoints_;
};

} // namespace chremote::remote

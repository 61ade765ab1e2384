#include <chremote/remote/wire.h>

#include <chremote/core/json.h>

#include <stdexcept>

namespace chremote::remote::wire {
namespace {

bool IsBlank(std::string_view s) {
    return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

chremote::Status Invalid(std::string message) {
    return chremote::Status(chremote::StatusCode::invalid_argument, std::move(message));
}

chremote::Status ReadString(const chjson::sv_value& obj, std::string_view key, std::string& out) {
    const auto* v = obj.find(key);
    if (v == nullptr || !v->is_string()) {
        return Invalid("field '" + std::string(key) + "' must be a string");
    }
    out = std::string(v->as_string_view());
    return chremote::Status::Ok();
}

chremote::Status ReadStringList(const chjson::sv_value& obj, std::string_view key, std::vector<std::string>& out) {
    const auto* v = obj.find(key);
    if (v == nullptr || !v->is_array()) {
        return Invalid("field '" + std::string(key) + "' must be an array of strings");
    }
    for (const auto& item : v->as_array()) {
        if (!item.is_string()) {
            return Invalid("field '" + std::string(key) + "' must be an array of strings");
        }
        out.emplace_back(item.as_string_view());
    }
    return chremote::Status::Ok();
}

} // namespace

chjson::value ToJson(const Endpoint& endpoint, std::string_view sender) {
    const auto& props = endpoint.properties();
    return chjson::value(chjson::value::object{
        {"sender", chjson::value(std::string(sender))},
        {"uid", chjson::value(endpoint.uid())},
        {"configurations", MakeStringArray(endpoint.configurations())},
        {"name", chjson::value(endpoint.name())},
        {"specifications", MakeStringArray(endpoint.specifications())},
        {"properties", chjson::value(chjson::value::object(props.begin(), props.end()))},
    });
}

std::string DumpEndpoints(const std::vector<ExportEndpointPtr>& endpoints, std::string_view sender) {
    chjson::value::array arr;
    arr.reserve(endpoints.size());
    for (const auto& ep : endpoints) {
        arr.push_back(ToJson(*ep, sender));
    }
    return chjson::dump(chjson::value(std::move(arr)));
}

std::string DumpEndpoint(const Endpoint& endpoint, std::string_view sender) {
    return chjson::dump(ToJson(endpoint, sender));
}

chremote::Result<Record> ParseRecord(const chjson::sv_value& v) {
    if (!v.is_object()) {
        return Invalid("endpoint record must be an object");
    }

    Record r;
    if (auto st = ReadString(v, "sender", r.sender); !st.ok()) return st;
    if (auto st = ReadString(v, "uid", r.uid); !st.ok()) return st;
    if (auto st = ReadString(v, "name", r.name); !st.ok()) return st;
    if (auto st = ReadStringList(v, "configurations", r.configurations); !st.ok()) return st;
    if (auto st = ReadStringList(v, "specifications", r.specifications); !st.ok()) return st;

    if (r.uid.empty()) {
        return Invalid("field 'uid' must not be empty");
    }
    if (r.configurations.empty()) {
        return Invalid("endpoint " + r.uid + " has no configuration");
    }

    // properties may be absent or null
    if (const auto* props = v.find("properties"); props != nullptr && !props->is_null()) {
        if (!props->is_object()) {
            return Invalid("field 'properties' must be an object");
        }
        for (const auto& [key, item] : props->as_object()) {
            r.properties[std::string(key)] = chremote::json::ToOwned(item);
        }
    }
    return r;
}

chremote::Result<std::vector<Record>> ParseRecords(std::string_view body) {
    std::vector<Record> out;
    if (IsBlank(body)) {
        return out;
    }

    auto parsed = chjson::parse(body);
    if (parsed.err) {
        return Invalid(chremote::json::DescribeParseError(parsed.err));
    }

    const auto& root = parsed.doc.root();
    if (root.is_null()) {
        return out;
    }
    if (!root.is_array()) {
        return Invalid("expected a JSON array of endpoints");
    }

    for (const auto& item : root.as_array()) {
        auto r = ParseRecord(item);
        if (!r.ok()) {
            return r.status();
        }
        out.push_back(std::move(r).value());
    }
    return out;
}

Properties ToImportProperties(Properties properties, std::string_view sender) {
    properties[std::string(prop::kImported)] = chjson::value(true);

    if (auto it = properties.find(prop::kExportedConfigs); it != properties.end()) {
        properties[std::string(prop::kImportedConfigs)] = it->second;
    }
    properties.erase(std::string(prop::kExportedConfigs));
    properties.erase(std::string(prop::kExportedInterfaces));

    properties[std::string(prop::kFrameworkUid)] = chjson::value(std::string(sender));
    return properties;
}

chremote::Result<ImportEndpointPtr> ToImportEndpoint(Record record, std::string server_address) {
    auto properties = ToImportProperties(std::move(record.properties), record.sender);
    try {
        ImportEndpointPtr endpoint = std::make_shared<const ImportEndpoint>(
            std::move(record.uid),
            std::move(record.sender),
            std::move(record.configurations),
            std::move(record.name),
            std::move(record.specifications),
            std::move(properties),
            std::move(server_address));
        return endpoint;
    } catch (const std::invalid_argument& ex) {
        return Invalid(ex.what());
    }
}

} // namespace chremote::remote::wire

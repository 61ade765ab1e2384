#include <chremote/remote/properties.h>

namespace chremote::remote {

std::optional<std::string> GetString(const Properties& props, std::string_view key) {
    auto it = props.find(key);
    if (it == props.end() || !it->second.is_string()) {
        return std::nullopt;
    }
    return std::string(it->second.as_string_view());
}

std::vector<std::string> GetStringList(const Properties& props, std::string_view key) {
    std::vector<std::string> out;
    auto it = props.find(key);
    if (it == props.end()) {
        return out;
    }

    const auto& v = it->second;
    if (v.is_string()) {
        out.emplace_back(v.as_string_view());
        return out;
    }
    if (v.is_array()) {
        for (const auto& item : v.as_array()) {
            if (item.is_string()) {
                out.emplace_back(item.as_string_view());
            }
        }
    }
    return out;
}

chjson::value MakeStringArray(const std::vector<std::string>& items) {
    chjson::value::array arr;
    arr.reserve(items.size());
    for (const auto& s : items) {
        arr.push_back(chjson::value(s));
    }
    return chjson::value(std::move(arr));
}

} // namespace chremote::remote

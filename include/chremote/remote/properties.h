#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <chjson/chjson.hpp>

namespace chremote::remote {

// Service / endpoint properties: string keys, arbitrary JSON values.
using Properties = std::map<std::string, chjson::value, std::less<>>;

namespace prop {

inline constexpr std::string_view kServiceId = "service.id";
inline constexpr std::string_view kObjectClass = "objectClass";
inline constexpr std::string_view kEndpointName = "endpoint.name";
inline constexpr std::string_view kExportedConfigs = "exported.configs";
inline constexpr std::string_view kExportedInterfaces = "exported.interfaces";
inline constexpr std::string_view kImported = "imported";
inline constexpr std::string_view kImportedConfigs = "imported.configs";
inline constexpr std::string_view kFrameworkUid = "framework.uid";

} // namespace prop

// Returns the string value of key, if present and a string.
std::optional<std::string> GetString(const Properties& props, std::string_view key);

// Accepts either a single string or an array of strings; anything else yields an empty list.
std::vector<std::string> GetStringList(const Properties& props, std::string_view key);

chjson::value MakeStringArray(const std::vector<std::string>& items);

} // namespace chremote::remote

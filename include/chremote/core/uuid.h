#pragma once

#include <string>
#include <string_view>

namespace chremote {

// Random RFC 4122 version 4 UUID, lowercase: "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx".
// Thread-safe
std::string NewUuid();

bool IsUuid(std::string_view s);

} // namespace chremote

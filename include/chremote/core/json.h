#pragma once

#include <string>

#include <chjson/chjson.hpp>

namespace chremote::json {

// "invalid json: <code> at line L, col C"
std::string DescribeParseError(const chjson::error& e);

// Deep copy of a parsed (string_view backed) value into an owning value.
chjson::value ToOwned(const chjson::sv_value& v);

} // namespace chremote::json

#include <chremote/core/json.h>

#include <sstream>

namespace chremote::json {
namespace {

const char* ErrorCodeToString(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "ok";
        case chjson::error_code::unexpected_eof: return "unexpected_eof";
        case chjson::error_code::invalid_value: return "invalid_value";
        case chjson::error_code::invalid_number: return "invalid_number";
        case chjson::error_code::invalid_string: return "invalid_string";
        case chjson::error_code::invalid_escape: return "invalid_escape";
        case chjson::error_code::invalid_unicode_escape: return "invalid_unicode_escape";
        case chjson::error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
        case chjson::error_code::expected_colon: return "expected_colon";
        case chjson::error_code::expected_comma_or_end: return "expected_comma_or_end";
        case chjson::error_code::expected_key_string: return "expected_key_string";
        case chjson::error_code::trailing_characters: return "trailing_characters";
        case chjson::error_code::nesting_too_deep: return "nesting_too_deep";
        case chjson::error_code::out_of_memory: return "out_of_memory";
    }
    return "unknown";
}

} // namespace

std::string DescribeParseError(const chjson::error& e) {
    std::ostringstream oss;
    oss << "invalid json: " << ErrorCodeToString(e.code)
        << " at line " << e.line << ", col " << e.column;
    return oss.str();
}

chjson::value ToOwned(const chjson::sv_value& v) {
    if (v.is_string()) {
        return chjson::value(std::string(v.as_string_view()));
    }
    if (v.is_bool()) {
        return chjson::value(v.as_bool());
    }
    if (v.is_number()) {
        if (v.is_int()) {
            return chjson::value::integer(v.as_int());
        }
        return chjson::value(v.as_double());
    }
    if (v.is_array()) {
        chjson::value::array arr;
        for (const auto& item : v.as_array()) {
            arr.push_back(ToOwned(item));
        }
        return chjson::value(std::move(arr));
    }
    if (v.is_object()) {
        chjson::value::object obj;
        for (const auto& [key, item] : v.as_object()) {
            obj.emplace(std::string(key), ToOwned(item));
        }
        return chjson::value(std::move(obj));
    }
    return chjson::value();
}

} // namespace chremote::json

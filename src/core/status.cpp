#include <chremote/core/status.h>

namespace chremote {

std::string_view StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::already_exists: return "already_exists";
        case StatusCode::needs_reexport: return "needs_reexport";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

std::string Status::ToString() const {
    std::string out(StatusCodeName(code_));
    if (!message_.empty()) {
        out.append(": ");
        out.append(message_);
    }
    return out;
}

} // namespace chremote

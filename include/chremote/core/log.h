#pragma once

#include <string_view>
#include <utility>

#include <chlog/chlog.hpp>

namespace chremote::log {

// Thread-safe. May be called again to change the level.
void Init(std::string_view level);

// Thread-safe after Init(); always returns a valid logger.
chlog::logger& Get();

chlog::level ParseLevel(std::string_view level);

template <class... Args>
inline void debug(std::format_string<Args...> fmt, Args&&... args) {
    Get().debug(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void info(std::format_string<Args...> fmt, Args&&... args) {
    Get().info(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void warn(std::format_string<Args...> fmt, Args&&... args) {
    Get().warn(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void error(std::format_string<Args...> fmt, Args&&... args) {
    Get().error(fmt, std::forward<Args>(args)...);
}

} // namespace chremote::log

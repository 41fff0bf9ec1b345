#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace rowfeed {

using logger_t = spdlog::logger;

logger_t& getLogger();

/**
 * @brief Set the level of the process-wide logger ("trace", "debug", "info", "warn",
 * "error", "critical" or "off"). Unknown names leave the level untouched and return false.
 */
bool setLogLevel(const std::string& levelName);

namespace Logger {

template <typename... Args>
inline void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    getLogger().trace(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    getLogger().debug(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    getLogger().info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    getLogger().warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    getLogger().error(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    getLogger().critical(fmt, std::forward<Args>(args)...);
}
}  // namespace Logger
}  // namespace rowfeed

#pragma once

#ifdef NDEBUG
#define rf_assert(...)
#define rf_unreachable(...) __builtin_unreachable()
#else

#include <fmt/format.h>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

namespace rowfeed {

void logAssertionFailed(std::string_view, const std::source_location&, std::string msg) noexcept;

template <typename... Args>
[[noreturn]] void printAssertFailed(std::string_view condition, std::string_view message,
                                    const std::source_location& source_location,
                                    Args&&... args) noexcept {
    std::string formatted_message = fmt::vformat(message, fmt::make_format_args(args...));
    logAssertionFailed(condition, source_location, formatted_message);
    std::abort();
}

}  // namespace rowfeed

#define rf_assert(cond, msg, ...)                                                                 \
    if (!(cond)) {                                                                                \
        rowfeed::printAssertFailed(#cond, (msg), std::source_location::current(), ##__VA_ARGS__); \
    }

#define rf_unreachable(msg)                                                              \
    do {                                                                                 \
        rowfeed::printAssertFailed("unreachable", msg, std::source_location::current()); \
    } while (0)

#endif

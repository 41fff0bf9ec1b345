#include "common/logging.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <vector>

namespace rowfeed {

namespace {

constexpr const char* logFileVariable = "ROWFEED_LOG_FILE";
constexpr const char* logLevelVariable = "ROWFEED_LOG_LEVEL";

}  // namespace

logger_t& getLogger() {
    static auto logger = []() {
        // stdout carries batch output of the CLI, so the console sink goes to stderr
        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::debug);
        sinks.push_back(console_sink);

        if (const char* logFile = std::getenv(logFileVariable); logFile && *logFile) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

        auto logger = spdlog::logger("rowfeed", sinks.begin(), sinks.end());
        logger.set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
        logger.set_level(spdlog::level::info);
        if (const char* level = std::getenv(logLevelVariable); level && *level) {
            auto parsed = spdlog::level::from_str(level);
            if (parsed != spdlog::level::off || std::string(level) == "off")
                logger.set_level(parsed);
        }
        return logger;
    }();

    return logger;
}

bool setLogLevel(const std::string& levelName) {
    auto level = spdlog::level::from_str(levelName);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && levelName != "off")
        return false;
    getLogger().set_level(level);
    return true;
}

}  // namespace rowfeed

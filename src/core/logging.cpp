#include "core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

static const char* kLoggerName = "composectl";
static std::mutex g_init_mutex;

spdlog::level::level_enum Logging::parse_level(const std::string& level) {
    std::string name = level;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::warn;
}

void Logging::init(const std::string& level) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        // stderr only: stdout belongs to the orchestrator and to completion output
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    logger->set_level(parse_level(level));
}

std::shared_ptr<spdlog::logger> Logging::get() {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        init("warn");
        logger = spdlog::get(kLoggerName);
    }
    return logger;
}

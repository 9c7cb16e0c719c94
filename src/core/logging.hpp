#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

class Logging {
public:
    /// Create the stderr logger ("composectl") if needed and set its level.
    /// Unknown level names fall back to "warn".
    static void init(const std::string& level);

    /// Shared logger; initializes at "warn" on first use
    static std::shared_ptr<spdlog::logger> get();

    static spdlog::level::level_enum parse_level(const std::string& level);
};

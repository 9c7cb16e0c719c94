#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <cstdlib>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (const char* explicit_path = std::getenv("COMPOSECTL_CONFIG")) {
        if (explicit_path[0] != '\0') {
            return fs::path(expand_home(explicit_path)).parent_path().string();
        }
    }
    if (is_privileged()) {
        return "/etc/composectl";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/composectl";
}

std::string Config::config_path() {
    if (const char* explicit_path = std::getenv("COMPOSECTL_CONFIG")) {
        if (explicit_path[0] != '\0') {
            return expand_home(explicit_path);
        }
    }
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::default_cache_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/cache/services.json";
}

std::string Config::resolved_cache_path() const {
    if (!config_.cache_path.empty()) {
        return expand_home(config_.cache_path);
    }
    return default_cache_path();
}

bool Config::load() {
    std::string path = config_path();
    std::error_code ec;
    // An unreachable path (permissions, name too long, loops) counts as missing
    if (path.empty() || !fs::exists(path, ec) || ec) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Project section
        if (auto project = root["project"]) {
            config_.project_name = project["name"].as<std::string>(config_.project_name);
            config_.project_directory = project["directory"].as<std::string>(config_.project_directory);
        }

        // Compose section
        if (auto compose = root["compose"]) {
            config_.compose_binary = compose["binary"].as<std::string>(config_.compose_binary);
            config_.validate_services = compose["validate_services"].as<bool>(config_.validate_services);
            if (auto flags = compose["extra_flags"]) {
                if (flags.IsSequence()) {
                    config_.extra_flags.clear();
                    for (const auto& flag : flags) {
                        config_.extra_flags.push_back(flag.as<std::string>());
                    }
                    config_.extra_flags_set = true;
                }
            }
        }

        // Docker section
        if (auto docker = root["docker"]) {
            config_.docker_group = docker["group"].as<std::string>(config_.docker_group);
            config_.require_group = docker["require_group"].as<bool>(config_.require_group);
        }

        // Cache section
        if (auto cache = root["cache"]) {
            config_.cache_expire_seconds = cache["expire_seconds"].as<int>(config_.cache_expire_seconds);
            config_.cache_persist = cache["persist"].as<bool>(config_.cache_persist);
            config_.cache_path = cache["path"].as<std::string>(config_.cache_path);
        }

        // Log section
        if (auto log = root["log"]) {
            config_.log_level = log["level"].as<std::string>(config_.log_level);
        }

        return true;
    } catch (const YAML::Exception&) {
        // Parse failed, keep defaults
        config_ = AppConfig();
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }

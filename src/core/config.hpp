#pragma once

#include <string>
#include <vector>

struct AppConfig {
    // Project
    std::string project_name;       // empty: base name of the project directory
    std::string project_directory;  // empty: current directory at call time

    // Orchestrator
    std::string compose_binary = "docker-compose";
    std::vector<std::string> extra_flags;  // replaces the default "-p <project>" pair
    bool extra_flags_set = false;          // true when extra_flags came from the file
    bool validate_services = true;

    // Docker group pre-flight check (up)
    std::string docker_group = "docker";
    bool require_group = true;

    // Service name cache
    int cache_expire_seconds = 60;
    bool cache_persist = true;
    std::string cache_path;  // empty: <config dir>/cache/services.json

    // Logging
    std::string log_level = "warn";
};

class Config {
public:
    Config();
    ~Config();

    bool load();

    AppConfig& data();
    const AppConfig& data() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string default_cache_path();
    static std::string expand_home(const std::string& path);

    /// Cache file actually used (configured path or the default)
    std::string resolved_cache_path() const;

private:
    AppConfig config_;
};

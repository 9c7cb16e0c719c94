#pragma once

#include "core/config.hpp"
#include "core/setting.hpp"

#include <string>
#include <vector>

/// Where and how the orchestrator is invoked for one project
struct ProjectSettings {
    std::string binary = "docker-compose";
    Setting<std::string> directory;                 // Computed: current directory
    Setting<std::vector<std::string>> extra_flags;  // Computed: {"-p", lower(name)}

    /// Settings from the config file, with command-line overrides
    /// (empty override = not given)
    static ProjectSettings from_config(const AppConfig& config,
                                       const std::string& directory_override = "",
                                       const std::string& project_override = "");

    /// Absolute, normalized project directory
    std::string resolve_directory() const;

    std::vector<std::string> resolve_extra_flags() const;

    /// {"-p", lower(name)}; empty name: base name of `directory`
    static std::vector<std::string> default_extra_flags(const std::string& name,
                                                        const std::string& directory);
};

#include "core/project.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

static std::string absolute_directory(const std::string& dir) {
    std::error_code ec;
    fs::path p = dir.empty() ? fs::current_path(ec) : fs::path(Config::expand_home(dir));
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    std::string normalized = abs.lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::vector<std::string> ProjectSettings::default_extra_flags(const std::string& name,
                                                              const std::string& directory) {
    std::string project = name;
    if (project.empty()) {
        project = fs::path(absolute_directory(directory)).filename().string();
    }
    std::transform(project.begin(), project.end(), project.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (project.empty()) return {};
    return {"-p", project};
}

ProjectSettings ProjectSettings::from_config(const AppConfig& config,
                                             const std::string& directory_override,
                                             const std::string& project_override) {
    ProjectSettings settings;
    settings.binary = config.compose_binary;

    std::string static_dir = !directory_override.empty() ? directory_override : config.project_directory;
    if (!static_dir.empty()) {
        settings.directory = Setting<std::string>::fixed(static_dir);
    } else {
        settings.directory = Setting<std::string>::computed([] {
            std::error_code ec;
            return fs::current_path(ec).string();
        });
    }

    if (config.extra_flags_set && project_override.empty()) {
        settings.extra_flags = Setting<std::vector<std::string>>::fixed(config.extra_flags);
    } else {
        std::string name = !project_override.empty() ? project_override : config.project_name;
        Setting<std::string> directory = settings.directory;
        settings.extra_flags = Setting<std::vector<std::string>>::computed([name, directory] {
            return default_extra_flags(name, directory.resolve());
        });
    }
    return settings;
}

std::string ProjectSettings::resolve_directory() const {
    return absolute_directory(directory.resolve());
}

std::vector<std::string> ProjectSettings::resolve_extra_flags() const {
    return extra_flags.resolve();
}

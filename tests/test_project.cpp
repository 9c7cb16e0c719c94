#include <gtest/gtest.h>
#include "core/project.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using Args = std::vector<std::string>;

TEST(ProjectSettingsTest, DefaultFlagsLowerCaseTheName) {
    EXPECT_EQ(ProjectSettings::default_extra_flags("MySim", "/srv/x"), Args({"-p", "mysim"}));
}

TEST(ProjectSettingsTest, DefaultFlagsFallBackToDirectoryName) {
    EXPECT_EQ(ProjectSettings::default_extra_flags("", "/srv/Demo-App/"), Args({"-p", "demo-app"}));
}

TEST(ProjectSettingsTest, DefaultsAreComputed) {
    AppConfig config;
    ProjectSettings settings = ProjectSettings::from_config(config);

    EXPECT_EQ(settings.binary, "docker-compose");
    EXPECT_EQ(settings.directory.kind(), Setting<std::string>::Kind::Computed);
    EXPECT_EQ(settings.extra_flags.kind(), Setting<Args>::Kind::Computed);
    EXPECT_EQ(settings.resolve_directory(), fs::current_path().lexically_normal().string());
}

TEST(ProjectSettingsTest, ConfiguredDirectoryIsStatic) {
    AppConfig config;
    config.project_directory = "/srv/demo/";
    config.project_name = "Demo";
    ProjectSettings settings = ProjectSettings::from_config(config);

    EXPECT_EQ(settings.directory.kind(), Setting<std::string>::Kind::Static);
    EXPECT_EQ(settings.resolve_directory(), "/srv/demo");
    EXPECT_EQ(settings.resolve_extra_flags(), Args({"-p", "demo"}));
}

TEST(ProjectSettingsTest, DirectoryOverrideWins) {
    AppConfig config;
    config.project_directory = "/srv/demo";
    ProjectSettings settings = ProjectSettings::from_config(config, "/srv/other");

    EXPECT_EQ(settings.resolve_directory(), "/srv/other");
    EXPECT_EQ(settings.resolve_extra_flags(), Args({"-p", "other"}));
}

TEST(ProjectSettingsTest, ConfiguredExtraFlagsAreUsedVerbatim) {
    AppConfig config;
    config.extra_flags = {"-f", "compose.dev.yml", "-p", "Dev"};
    config.extra_flags_set = true;
    ProjectSettings settings = ProjectSettings::from_config(config);

    EXPECT_EQ(settings.extra_flags.kind(), Setting<Args>::Kind::Static);
    EXPECT_EQ(settings.resolve_extra_flags(), config.extra_flags);
}

TEST(ProjectSettingsTest, EmptyConfiguredFlagsMeanNoFlags) {
    AppConfig config;
    config.extra_flags_set = true;
    ProjectSettings settings = ProjectSettings::from_config(config);
    EXPECT_TRUE(settings.resolve_extra_flags().empty());
}

TEST(ProjectSettingsTest, ProjectOverrideReplacesConfiguredFlags) {
    AppConfig config;
    config.extra_flags = {"-p", "dev"};
    config.extra_flags_set = true;
    ProjectSettings settings = ProjectSettings::from_config(config, "", "Staging");

    EXPECT_EQ(settings.resolve_extra_flags(), Args({"-p", "staging"}));
}

TEST(ProjectSettingsTest, ComputedFlagsFollowComputedDirectory) {
    ProjectSettings settings;
    std::string dir = "/srv/first";
    settings.directory = Setting<std::string>::computed([&dir] { return dir; });
    Setting<std::string> directory = settings.directory;
    settings.extra_flags = Setting<Args>::computed([directory] {
        return ProjectSettings::default_extra_flags("", directory.resolve());
    });

    EXPECT_EQ(settings.resolve_extra_flags(), Args({"-p", "first"}));
    dir = "/srv/second";
    EXPECT_EQ(settings.resolve_directory(), "/srv/second");
    EXPECT_EQ(settings.resolve_extra_flags(), Args({"-p", "second"}));
}

#pragma once

#include "core/command_table.hpp"
#include "core/config.hpp"
#include "core/group_check.hpp"
#include "core/project.hpp"
#include "core/service_catalog.hpp"
#include "process/process_runner.hpp"

#include <functional>
#include <string>
#include <vector>

/// Runs one subcommand: parse, pre-flight checks, service validation, then
/// `<binary> <extra flags...> <forwarded args...>` in the project directory.
class Dispatcher {
public:
    using RunFn = std::function<RunResult(const std::vector<std::string>& argv,
                                          const std::string& cwd)>;
    using GroupCheckFn = std::function<GroupCheck(const std::string& group)>;

    // Exit codes of our own failures; anything else is the orchestrator's
    static constexpr int kUnknownCommand = 1;
    static constexpr int kUsageError = 2;
    static constexpr int kPreconditionFailed = 3;
    static constexpr int kDiscoveryFailed = 4;

    /// Empty `run` / `group_check` use ProcessRunner::run / check_group_membership
    Dispatcher(const AppConfig& config, const ProjectSettings& project,
               ServiceCatalog& catalog, RunFn run = nullptr, GroupCheckFn group_check = nullptr);

    int dispatch(const std::string& command, const std::vector<std::string>& args);

    /// Candidates for the last word of `words` (words[0] is the subcommand)
    std::vector<std::string> complete(const std::vector<std::string>& words);

    void set_program_name(const std::string& prog) { prog_ = prog; }

private:
    const AppConfig& config_;
    const ProjectSettings& project_;
    ServiceCatalog& catalog_;
    RunFn run_;
    GroupCheckFn group_check_;
    std::string prog_ = "composectl";

    int check_docker_group();
    int validate_services(const std::vector<std::string>& services,
                          const std::string& directory,
                          const std::vector<std::string>& extra_flags);
    int fix_up();
    int call(const std::vector<std::string>& argv, const std::string& cwd);
};

#include "core/dispatcher.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <iostream>

Dispatcher::Dispatcher(const AppConfig& config, const ProjectSettings& project,
                       ServiceCatalog& catalog, RunFn run, GroupCheckFn group_check)
    : config_(config),
      project_(project),
      catalog_(catalog),
      run_(std::move(run)),
      group_check_(std::move(group_check)) {
    if (!run_) {
        run_ = [](const std::vector<std::string>& argv, const std::string& cwd) {
            return ProcessRunner::run(argv, cwd);
        };
    }
    if (!group_check_) {
        group_check_ = &check_group_membership;
    }
}

int Dispatcher::dispatch(const std::string& command, const std::vector<std::string>& args) {
    const CommandSpec* spec = CommandTable::find(command);
    if (!spec) {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run '" << prog_ << " help' for usage.\n";
        return kUnknownCommand;
    }

    ParseResult parsed = CommandTable::parse(*spec, args);
    if (!parsed.success) {
        std::cerr << "Usage: " << prog_ << " " << spec->name << " [OPTIONS] ...\n";
        std::cerr << "Try '" << prog_ << " " << spec->name << " --help' for help.\n\n";
        std::cerr << "Error: " << parsed.error << "\n";
        return kUsageError;
    }
    const CommandOptions& opts = parsed.options;

    if (opts.help) {
        std::cout << CommandTable::usage(*spec, prog_);
        return 0;
    }

    if (!spec->forward) {
        return fix_up();
    }

    // Both settings are evaluated once for the whole invocation
    std::string directory = project_.resolve_directory();
    std::vector<std::string> extra_flags = project_.resolve_extra_flags();

    if (spec->requires_group && config_.require_group) {
        int rc = check_docker_group();
        if (rc != 0) return rc;
    }

    if (config_.validate_services) {
        auto services = CommandTable::named_services(*spec, opts);
        if (!services.empty()) {
            int rc = validate_services(services, directory, extra_flags);
            if (rc != 0) return rc;
        }
    }

    std::vector<std::string> argv;
    argv.push_back(project_.binary);
    argv.insert(argv.end(), extra_flags.begin(), extra_flags.end());
    auto forwarded = CommandTable::forwarded_args(*spec, opts);
    argv.insert(argv.end(), forwarded.begin(), forwarded.end());

    return call(argv, directory);
}

int Dispatcher::call(const std::vector<std::string>& argv, const std::string& cwd) {
    Logging::get()->debug("running: {} (in {})", ProcessRunner::format_command(argv),
                          cwd.empty() ? "." : cwd);

    RunResult result = run_(argv, cwd);
    if (!result.spawned) {
        std::cerr << "Error: " << result.error << "\n";
        return result.exit_code > 0 ? result.exit_code : ProcessRunner::kSpawnFailure;
    }
    if (result.exit_code != 0) {
        Logging::get()->debug("'{}' exited with status {}", argv.front(), result.exit_code);
    }
    return result.exit_code;
}

// ── Pre-flight checks ───────────────────────────────────────

int Dispatcher::check_docker_group() {
    GroupCheck check = group_check_(config_.docker_group);
    auto log = Logging::get();

    switch (check.status) {
    case GroupStatus::Member:
        log->debug("user '{}' is in group '{}'", check.user, config_.docker_group);
        return 0;
    case GroupStatus::Unsupported:
        log->debug("skipping docker group check: {}", check.detail);
        return 0;
    case GroupStatus::Error:
        // Introspection failed for another reason; the orchestrator will
        // report a permission problem itself if there is one
        log->warn("skipping docker group check: {}", check.detail);
        return 0;
    case GroupStatus::NotMember:
        break;
    }

    std::cerr << "Error: The current user is not in the " << config_.docker_group << " group."
              << " Please add it to '/etc/group' or use '" << prog_ << " fix-up'\n";
    if (!check.detail.empty()) {
        log->debug("docker group check: {}", check.detail);
    }
    return kPreconditionFailed;
}

int Dispatcher::validate_services(const std::vector<std::string>& services,
                                  const std::string& directory,
                                  const std::vector<std::string>& extra_flags) {
    auto is_known = [](const DiscoveryResult& listed, const std::string& service) {
        return std::find(listed.services.begin(), listed.services.end(), service) != listed.services.end();
    };

    DiscoveryResult listed = catalog_.list_services(directory, extra_flags);
    if (listed.success && listed.from_cache) {
        // A cached list may predate an edit of the compose file; only a
        // fresh discovery can reject a name
        for (const auto& service : services) {
            if (is_known(listed, service)) continue;
            Logging::get()->debug("'{}' not in cached services, rediscovering", service);
            catalog_.invalidate(directory, extra_flags);
            listed = catalog_.list_services(directory, extra_flags);
            break;
        }
    }
    if (!listed.success) {
        std::cerr << "Error: " << listed.error << "\n";
        return kDiscoveryFailed;
    }

    for (const auto& service : services) {
        if (is_known(listed, service)) continue;
        std::string choices;
        for (const auto& known : listed.services) {
            if (!choices.empty()) choices += ", ";
            choices += "'" + known + "'";
        }
        std::cerr << "Error: Invalid value for 'SERVICE': '" << service << "' is not one of "
                  << (choices.empty() ? "(no services declared)" : choices) << ".\n";
        return kUsageError;
    }
    return 0;
}

// ── fix-up ──────────────────────────────────────────────────

int Dispatcher::fix_up() {
    std::string user = current_user_name();
    if (user.empty()) {
        std::cerr << "Error: cannot determine the current user name\n";
        return kPreconditionFailed;
    }

    // Changes /etc/group through sudo, then opens a new login session so the
    // membership takes effect
    int rc = call({"sudo", "adduser", user, config_.docker_group}, "");
    if (rc != 0) return rc;
    return call({"sudo", "login"}, "");
}

// ── Completion ──────────────────────────────────────────────

std::vector<std::string> Dispatcher::complete(const std::vector<std::string>& words) {
    std::vector<std::string> candidates;
    std::string incomplete = words.empty() ? "" : words.back();

    auto starts_with = [&incomplete](const std::string& s) {
        return s.compare(0, incomplete.size(), incomplete) == 0;
    };

    if (words.size() <= 1) {
        for (const auto& spec : CommandTable::all()) {
            if (starts_with(spec.name)) candidates.push_back(spec.name);
        }
        return candidates;
    }

    const CommandSpec* spec = CommandTable::find(words.front());
    if (!spec) return candidates;

    if (!incomplete.empty() && incomplete[0] == '-') {
        for (const auto& flag : CommandTable::flag_names(*spec)) {
            if (starts_with(flag)) candidates.push_back(flag);
        }
        return candidates;
    }

    std::vector<std::string> typed(words.begin() + 1, words.end() - 1);
    if (!CommandTable::completes_service(*spec, typed)) return candidates;

    return catalog_.complete_services(project_.resolve_directory(),
                                      project_.resolve_extra_flags(), incomplete);
}

#include "core/command_table.hpp"

#include <sstream>

// ── Forwarding templates ────────────────────────────────────

static std::vector<std::string> forward_up(const std::string& /*name*/, const CommandOptions& opts) {
    std::vector<std::string> args = {"up", "-d", "--build"};
    for (const auto& scale : opts.scales) {
        args.push_back("--scale");
        args.push_back(scale);
    }
    if (opts.force_recreate) args.push_back("--force-recreate");
    args.insert(args.end(), opts.positionals.begin(), opts.positionals.end());
    return args;
}

static std::vector<std::string> forward_down(const std::string& /*name*/, const CommandOptions& opts) {
    std::vector<std::string> args = {"down"};
    if (opts.remove_orphans) args.push_back("--remove-orphans");
    return args;
}

// start / stop / restart: the subcommand keeps its own name
static std::vector<std::string> forward_named(const std::string& name, const CommandOptions& opts) {
    std::vector<std::string> args = {name};
    args.insert(args.end(), opts.positionals.begin(), opts.positionals.end());
    return args;
}

// ps and status both map to "ps"
static std::vector<std::string> forward_ps(const std::string& /*name*/, const CommandOptions& opts) {
    std::vector<std::string> args = {"ps"};
    args.insert(args.end(), opts.positionals.begin(), opts.positionals.end());
    return args;
}

static std::vector<std::string> forward_logs(const std::string& /*name*/, const CommandOptions& opts) {
    std::vector<std::string> args = {"logs", "-f"};
    args.insert(args.end(), opts.positionals.begin(), opts.positionals.end());
    return args;
}

static std::vector<std::string> forward_config(const std::string& /*name*/, const CommandOptions& opts) {
    std::vector<std::string> args = {"config"};
    if (opts.services_only) args.push_back("--services");
    return args;
}

// exec / run: <name> <service> [command...]
static std::vector<std::string> forward_in_service(const std::string& name, const CommandOptions& opts) {
    std::vector<std::string> args = {name};
    args.insert(args.end(), opts.positionals.begin(), opts.positionals.end());
    args.insert(args.end(), opts.trailing.begin(), opts.trailing.end());
    return args;
}

static std::vector<std::string> forward_build(const std::string& /*name*/, const CommandOptions& opts) {
    std::vector<std::string> args = {"build"};
    for (const auto& service : opts.positionals) {
        if (!service.empty()) args.push_back(service);
    }
    args.insert(args.end(), opts.trailing.begin(), opts.trailing.end());
    return args;
}

static std::vector<std::string> forward_images(const std::string& /*name*/, const CommandOptions& opts) {
    std::vector<std::string> args = {"images"};
    args.insert(args.end(), opts.trailing.begin(), opts.trailing.end());
    return args;
}

// ── Table ───────────────────────────────────────────────────

static std::vector<CommandSpec> build_table() {
    std::vector<CommandSpec> table;

    CommandSpec up;
    up.name = "up";
    up.summary = "Create and start containers";
    up.arity = ServiceArity::Many;
    up.service_help = "The services to spin up";
    up.flags.push_back({"--scale", "", "SERVICE=NUM",
                        "Scale a service. Use the format 'service=number'",
                        nullptr, &CommandOptions::scales});
    up.flags.push_back({"--force-recreate", "--no-force-recreate", "",
                        "Force the recreation of the services",
                        &CommandOptions::force_recreate, nullptr});
    up.forward = forward_up;
    up.requires_group = true;
    table.push_back(up);

    CommandSpec down;
    down.name = "down";
    down.summary = "Stop and remove containers, networks, images, and volumes";
    down.flags.push_back({"--remove-orphans", "--no-remove-orphans", "",
                          "Remove the containers of the project that are not in the current config (default: on)",
                          &CommandOptions::remove_orphans, nullptr});
    down.forward = forward_down;
    table.push_back(down);

    struct Simple { const char* name; const char* summary; const char* service_help; };
    for (const auto& s : {Simple{"start", "Start services", "The services to start"},
                          Simple{"stop", "Stop services", "The services to stop"},
                          Simple{"restart", "Restart services", "The services to restart"}}) {
        CommandSpec spec;
        spec.name = s.name;
        spec.summary = s.summary;
        spec.arity = ServiceArity::Many;
        spec.service_help = s.service_help;
        spec.forward = forward_named;
        table.push_back(spec);
    }

    CommandSpec ps;
    ps.name = "ps";
    ps.summary = "List containers";
    ps.arity = ServiceArity::Many;
    ps.pass_unknown_options = true;
    ps.service_help = "The services to list";
    ps.forward = forward_ps;
    table.push_back(ps);

    CommandSpec status = ps;
    status.name = "status";
    status.summary = "Show the services status";
    status.service_help = "The services to check the status";
    table.push_back(status);

    CommandSpec logs;
    logs.name = "logs";
    logs.summary = "View output logs from containers";
    logs.arity = ServiceArity::Many;
    logs.service_help = "The services to show the logs";
    logs.forward = forward_logs;
    table.push_back(logs);

    CommandSpec config;
    config.name = "config";
    config.summary = "Validate and view the compose file";
    config.flags.push_back({"--services", "--no-services", "",
                            "List the services instead of the whole configuration",
                            &CommandOptions::services_only, nullptr});
    config.forward = forward_config;
    table.push_back(config);

    CommandSpec exec;
    exec.name = "exec";
    exec.summary = "Execute a command in the running container";
    exec.arity = ServiceArity::One;
    exec.pass_unknown_options = true;
    exec.service_help = "The container where the command will be run";
    exec.trailing_metavar = "COMMAND...";
    exec.forward = forward_in_service;
    table.push_back(exec);

    CommandSpec run = exec;
    run.name = "run";
    run.summary = "Run a one-off command in the container";
    table.push_back(run);

    CommandSpec build;
    build.name = "build";
    build.summary = "Build the container";
    build.arity = ServiceArity::Optional;
    build.pass_unknown_options = true;
    build.service_help = "The service to build";
    build.trailing_metavar = "ARGS...";
    build.forward = forward_build;
    table.push_back(build);

    CommandSpec images;
    images.name = "images";
    images.summary = "List the images used by the containers";
    images.pass_unknown_options = true;
    images.trailing_metavar = "ARGS...";
    images.forward = forward_images;
    table.push_back(images);

    CommandSpec fix_up;
    fix_up.name = "fix-up";
    fix_up.summary = "Add the current user to the docker group (uses sudo, then starts a new login session)";
    table.push_back(fix_up);

    return table;
}

const std::vector<CommandSpec>& CommandTable::all() {
    static const std::vector<CommandSpec> table = build_table();
    return table;
}

const CommandSpec* CommandTable::find(const std::string& name) {
    for (const auto& spec : all()) {
        if (spec.name == name) return &spec;
    }
    return nullptr;
}

// ── Parsing ─────────────────────────────────────────────────

static const FlagSpec* match_flag(const CommandSpec& spec, const std::string& token,
                                  bool& negated, std::string& inline_value, bool& has_inline) {
    std::string name = token;
    has_inline = false;
    auto eq = token.find('=');
    if (eq != std::string::npos) {
        name = token.substr(0, eq);
        inline_value = token.substr(eq + 1);
        has_inline = true;
    }
    for (const auto& flag : spec.flags) {
        if (name == flag.name) {
            negated = false;
            return &flag;
        }
        if (!flag.negated.empty() && name == flag.negated) {
            negated = true;
            return &flag;
        }
    }
    return nullptr;
}

ParseResult CommandTable::parse(const CommandSpec& spec, const std::vector<std::string>& args) {
    ParseResult result;
    CommandOptions& opts = result.options;

    bool options_done = false;   // after "--"
    bool slot_filled = false;    // One/Optional: service taken, rest is trailing

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& token = args[i];

        if (slot_filled || (spec.arity == ServiceArity::None && spec.pass_unknown_options &&
                            !opts.trailing.empty())) {
            opts.trailing.push_back(token);
            continue;
        }

        bool is_option = !options_done && token.size() > 1 && token[0] == '-';

        if (is_option && token == "--") {
            options_done = true;
            continue;
        }
        if (is_option && (token == "-h" || token == "--help")) {
            opts.help = true;
            continue;
        }

        if (is_option) {
            bool negated = false;
            bool has_inline = false;
            std::string value;
            const FlagSpec* flag = match_flag(spec, token, negated, value, has_inline);
            if (flag) {
                if (!flag->metavar.empty()) {
                    if (!has_inline) {
                        if (i + 1 >= args.size()) {
                            result.error = "Option '" + flag->name + "' requires an argument.";
                            return result;
                        }
                        value = args[++i];
                    }
                    (opts.*(flag->values)).push_back(value);
                } else {
                    if (has_inline) {
                        result.error = "Option '" + flag->name + "' does not take a value.";
                        return result;
                    }
                    opts.*(flag->toggle) = !negated;
                }
                continue;
            }
            if (!spec.pass_unknown_options) {
                result.error = "No such option: " + token;
                return result;
            }
            // Unknown option on a pass-through command: keep it in place
        }

        switch (spec.arity) {
        case ServiceArity::None:
            if (spec.pass_unknown_options) {
                opts.trailing.push_back(token);
                continue;
            }
            result.error = "Got unexpected extra argument (" + token + ")";
            return result;
        case ServiceArity::Many:
            opts.positionals.push_back(token);
            break;
        case ServiceArity::One:
        case ServiceArity::Optional:
            opts.positionals.push_back(token);
            slot_filled = true;
            break;
        }
    }

    if (spec.arity == ServiceArity::One && opts.positionals.empty() && !opts.help) {
        result.error = "Missing argument 'SERVICE'.";
        return result;
    }

    result.success = true;
    return result;
}

std::vector<std::string> CommandTable::forwarded_args(const CommandSpec& spec, const CommandOptions& opts) {
    if (!spec.forward) return {};
    return spec.forward(spec.name, opts);
}

std::vector<std::string> CommandTable::named_services(const CommandSpec& spec, const CommandOptions& opts) {
    std::vector<std::string> services;
    if (spec.arity == ServiceArity::None) return services;
    for (const auto& token : opts.positionals) {
        if (token.empty() || token[0] == '-') continue;
        services.push_back(token);
    }
    return services;
}

// ── Completion & usage ──────────────────────────────────────

bool CommandTable::completes_service(const CommandSpec& spec, const std::vector<std::string>& words) {
    if (spec.arity == ServiceArity::None) return false;

    bool options_done = false;
    size_t positional_count = 0;
    bool expecting_value = false;
    for (const auto& word : words) {
        if (expecting_value) {
            expecting_value = false;
            continue;
        }
        if (!options_done && word == "--") {
            options_done = true;
            continue;
        }
        if (!options_done && word.size() > 1 && word[0] == '-') {
            for (const auto& flag : spec.flags) {
                if (word == flag.name && !flag.metavar.empty()) expecting_value = true;
            }
            continue;
        }
        ++positional_count;
    }
    if (expecting_value) return false;

    if (spec.arity == ServiceArity::Many) return true;
    return positional_count == 0;
}

std::vector<std::string> CommandTable::flag_names(const CommandSpec& spec) {
    std::vector<std::string> names;
    for (const auto& flag : spec.flags) {
        names.push_back(flag.name);
        if (!flag.negated.empty()) names.push_back(flag.negated);
    }
    names.push_back("--help");
    return names;
}

std::string CommandTable::usage(const CommandSpec& spec, const std::string& prog) {
    std::ostringstream out;
    out << "Usage: " << prog << " " << spec.name << " [OPTIONS]";
    switch (spec.arity) {
    case ServiceArity::None: break;
    case ServiceArity::Many: out << " [SERVICE]..."; break;
    case ServiceArity::One: out << " SERVICE"; break;
    case ServiceArity::Optional: out << " [SERVICE]"; break;
    }
    if (!spec.trailing_metavar.empty()) out << " [" << spec.trailing_metavar << "]";
    out << "\n\n  " << spec.summary << "\n";

    if (!spec.service_help.empty()) {
        out << "\nArguments:\n";
        out << "  SERVICE  " << spec.service_help << "\n";
    }

    out << "\nOptions:\n";
    for (const auto& flag : spec.flags) {
        std::string spelling = flag.name;
        if (!flag.negated.empty()) spelling += " / " + flag.negated;
        if (!flag.metavar.empty()) spelling += " " + flag.metavar;
        out << "  " << spelling << "\n      " << flag.help << "\n";
    }
    out << "  -h, --help\n      Show this message and exit.\n";
    return out.str();
}

#pragma once

#include <string>
#include <vector>

enum class ServiceArity {
    None,      // no service argument
    Many,      // zero or more services
    One,       // exactly one service, then a free-form command
    Optional   // zero or one service, then free-form arguments
};

/// Parsed subcommand input
struct CommandOptions {
    std::vector<std::string> positionals;  // services (and passed-through tokens), input order
    std::vector<std::string> trailing;     // tokens after the service slot, verbatim
    std::vector<std::string> scales;       // up --scale
    bool force_recreate = false;           // up
    bool remove_orphans = true;            // down
    bool services_only = false;            // config
    bool help = false;
};

struct FlagSpec {
    std::string name;        // "--force-recreate"
    std::string negated;     // "--no-force-recreate", empty if none
    std::string metavar;     // non-empty: flag takes a value (repeatable)
    std::string help;
    bool CommandOptions::* toggle = nullptr;
    std::vector<std::string> CommandOptions::* values = nullptr;
};

using ForwardFn = std::vector<std::string> (*)(const std::string& name, const CommandOptions& opts);

struct CommandSpec {
    std::string name;
    std::string summary;
    ServiceArity arity = ServiceArity::None;
    bool pass_unknown_options = false;  // unknown "-x" tokens are forwarded, not rejected
    std::vector<FlagSpec> flags;
    ForwardFn forward = nullptr;        // nullptr: no orchestrator call
    bool requires_group = false;        // docker-group pre-flight check
    std::string service_help;
    std::string trailing_metavar;       // "COMMAND..." / "ARGS..."
};

struct ParseResult {
    bool success = false;
    CommandOptions options;
    std::string error;
};

class CommandTable {
public:
    /// Every subcommand, in help order
    static const std::vector<CommandSpec>& all();

    /// nullptr if unknown
    static const CommandSpec* find(const std::string& name);

    static ParseResult parse(const CommandSpec& spec, const std::vector<std::string>& args);

    /// Arguments forwarded to the orchestrator (after binary and extra flags)
    static std::vector<std::string> forwarded_args(const CommandSpec& spec, const CommandOptions& opts);

    /// Positionals that name services (passed-through "-x" tokens excluded)
    static std::vector<std::string> named_services(const CommandSpec& spec, const CommandOptions& opts);

    /// Whether the word after `words` (already typed arguments of the
    /// subcommand) is completed with service names
    static bool completes_service(const CommandSpec& spec, const std::vector<std::string>& words);

    /// Flag spellings of the command, for completion
    static std::vector<std::string> flag_names(const CommandSpec& spec);

    static std::string usage(const CommandSpec& spec, const std::string& prog);
};

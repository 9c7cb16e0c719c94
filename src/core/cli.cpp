#include "core/cli.hpp"
#include "core/command_table.hpp"
#include "core/config.hpp"
#include "core/dispatcher.hpp"
#include "core/logging.hpp"
#include "core/project.hpp"
#include "core/service_cache_file.hpp"
#include "core/service_catalog.hpp"

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

static const char* kProg = "composectl";

// ── Subcommand dispatch ─────────────────────────────────────

CLI::GlobalOptions CLI::parse_global_options(const std::vector<std::string>& args) {
    GlobalOptions globals;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.empty() || arg[0] != '-') break;

        if (arg == "-C" || arg == "--directory" || arg == "-p" || arg == "--project") {
            if (i + 1 >= args.size()) {
                globals.error = "Option '" + arg + "' requires an argument.";
                break;
            }
            std::string& target = (arg == "-C" || arg == "--directory") ? globals.directory : globals.project;
            target = args[++i];
        } else if (arg.rfind("--directory=", 0) == 0) {
            globals.directory = arg.substr(12);
        } else if (arg.rfind("--project=", 0) == 0) {
            globals.project = arg.substr(10);
        } else if (arg == "-v" || arg == "--verbose") {
            globals.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            globals.help = true;
        } else if (arg == "--version") {
            globals.version = true;
        } else {
            globals.error = "No such option: " + arg;
            break;
        }
    }
    globals.next = i;
    return globals;
}

int CLI::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    // Completion must stay silent and never fail the shell
    if (!args.empty() && args[0] == "__complete") {
        std::vector<std::string> rest(args.begin() + 1, args.end());
        // The last word is the one being completed, never a global option value
        std::vector<std::string> typed(rest.begin(), rest.empty() ? rest.end() : rest.end() - 1);
        GlobalOptions globals = parse_global_options(typed);
        if (!globals.error.empty()) return 0;
        std::vector<std::string> words(rest.begin() + static_cast<long>(globals.next), rest.end());
        return cmd_complete(words, globals);
    }

    GlobalOptions globals = parse_global_options(args);
    if (!globals.error.empty()) {
        std::cerr << "Error: " << globals.error << "\n";
        std::cerr << "Run '" << kProg << " help' for usage.\n";
        return Dispatcher::kUsageError;
    }
    if (globals.version) return cmd_version();
    if (globals.help || globals.next >= args.size()) return cmd_help();

    const std::string& cmd = args[globals.next];
    std::vector<std::string> rest(args.begin() + static_cast<long>(globals.next) + 1, args.end());

    if (cmd == "help") {
        if (!rest.empty()) {
            if (const CommandSpec* spec = CommandTable::find(rest[0])) {
                std::cout << CommandTable::usage(*spec, kProg);
                return 0;
            }
        }
        return cmd_help();
    }
    if (cmd == "version") {
        return cmd_version();
    }
    if (cmd == "completion") {
        return cmd_completion(rest);
    }
    if (cmd == "cache-clear") {
        return cmd_cache_clear(globals);
    }

    return cmd_dispatch(cmd, rest, globals);
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "composectl: docker-compose front end for a project\n"
        "\n"
        "Usage:\n"
        "  composectl [-C DIR] [-p NAME] [-v] <command> [args]\n"
        "\n"
        "Options:\n"
        "  -C, --directory DIR   Project directory (default: current directory)\n"
        "  -p, --project NAME    Project name passed as '-p <name>' (lower-cased)\n"
        "  -v, --verbose         Debug logging on stderr\n"
        "  --version             Show version\n"
        "\n"
        "Commands:\n";
    for (const auto& spec : CommandTable::all()) {
        std::cout << "  " << std::left << std::setw(12) << spec.name << spec.summary << "\n";
    }
    std::cout <<
        "  cache-clear Forget the cached service names\n"
        "  completion  Print the shell completion function (bash|zsh)\n"
        "  version     Show version\n"
        "  help        Show this help, or 'help <command>'\n"
        "\n"
        "Setup (add to ~/.bashrc or ~/.zshrc, one-time):\n"
        "  eval \"$(composectl completion bash)\"   # for bash\n"
        "  eval \"$(composectl completion zsh)\"    # for zsh\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << kProg << " " << APP_VERSION << "\n";
    return 0;
}

// ── completion ──────────────────────────────────────────────

int CLI::cmd_completion(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: composectl completion <bash|zsh>\n";
        return Dispatcher::kUsageError;
    }

    const std::string& shell = args[0];
    if (shell == "bash") {
        // Words after the program name, up to and including the one being completed
        std::cout <<
            "_composectl_complete() {\n"
            "  local IFS=$'\\n'\n"
            "  COMPREPLY=( $(command composectl __complete \"${COMP_WORDS[@]:1:$COMP_CWORD}\" 2>/dev/null) )\n"
            "}\n"
            "complete -o default -F _composectl_complete composectl\n";
        return 0;
    }
    if (shell == "zsh") {
        std::cout <<
            "_composectl() {\n"
            "  local -a candidates\n"
            "  candidates=(\"${(@f)$(command composectl __complete \"${(@)words[2,CURRENT]}\" 2>/dev/null)}\")\n"
            "  compadd -a candidates\n"
            "}\n"
            "compdef _composectl composectl\n";
        return 0;
    }

    std::cerr << "Unsupported shell: " << shell << "\n";
    std::cerr << "Supported: bash, zsh\n";
    return Dispatcher::kUsageError;
}

// ── Shared setup ────────────────────────────────────────────

namespace {

struct Session {
    Config config;
    ProjectSettings project;
    std::unique_ptr<ServiceCatalog> catalog;
};

std::unique_ptr<Session> open_session(const CLI::GlobalOptions& globals) {
    auto session = std::make_unique<Session>();
    // A missing or unreadable file leaves the defaults in place
    session->config.load();
    const AppConfig& cfg = session->config.data();

    std::string level = cfg.log_level;
    if (const char* env = std::getenv("COMPOSECTL_LOG_LEVEL")) {
        if (env[0] != '\0') level = env;
    }
    if (globals.verbose) level = "debug";
    Logging::init(level);

    session->project = ProjectSettings::from_config(cfg, globals.directory, globals.project);

    int expire = cfg.cache_expire_seconds > 0 ? cfg.cache_expire_seconds
                                               : ServiceCatalog::kDefaultExpireSeconds;
    session->catalog = std::make_unique<ServiceCatalog>(cfg.compose_binary, nullptr,
                                                        std::chrono::seconds(expire));
    if (cfg.cache_persist) {
        std::string path = session->config.resolved_cache_path();
        if (!path.empty()) {
            session->catalog->attach_store(std::make_shared<ServiceCacheFile>(path));
        }
    }
    return session;
}

} // namespace

int CLI::cmd_complete(const std::vector<std::string>& words, const GlobalOptions& globals) {
    try {
        auto session = open_session(globals);
        Dispatcher dispatcher(session->config.data(), session->project, *session->catalog);

        std::vector<std::string> line = words.empty() ? std::vector<std::string>{""} : words;
        for (const auto& candidate : dispatcher.complete(line)) {
            std::cout << candidate << "\n";
        }
    } catch (const std::exception& e) {
        // No candidates rather than a broken shell
        Logging::get()->debug("completion failed: {}", e.what());
    }
    return 0;
}

int CLI::cmd_cache_clear(const GlobalOptions& globals) {
    auto session = open_session(globals);
    if (!session->catalog->clear()) {
        std::cerr << "Error: cannot remove " << session->config.resolved_cache_path() << "\n";
        return 1;
    }
    std::cout << "Service cache cleared.\n";
    return 0;
}

int CLI::cmd_dispatch(const std::string& command, const std::vector<std::string>& args,
                      const GlobalOptions& globals) {
    if (!CommandTable::find(command)) {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run '" << kProg << " help' for usage.\n";
        return Dispatcher::kUnknownCommand;
    }

    auto session = open_session(globals);
    Dispatcher dispatcher(session->config.data(), session->project, *session->catalog);
    dispatcher.set_program_name(kProg);
    return dispatcher.dispatch(command, args);
}

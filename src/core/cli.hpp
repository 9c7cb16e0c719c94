#pragma once

#include <string>
#include <vector>

class CLI {
public:
    /// Parse argv and dispatch to subcommand. Returns the process exit code.
    static int run(int argc, char* argv[]);

    struct GlobalOptions {
        std::string directory;   // -C / --directory
        std::string project;     // -p / --project
        bool verbose = false;    // -v / --verbose
        bool help = false;
        bool version = false;
        std::string error;
        size_t next = 0;         // index of the first non-global argument
    };

    /// Parse the options that precede the subcommand
    static GlobalOptions parse_global_options(const std::vector<std::string>& args);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_completion(const std::vector<std::string>& args);
    static int cmd_cache_clear(const GlobalOptions& globals);
    static int cmd_complete(const std::vector<std::string>& words, const GlobalOptions& globals);
    static int cmd_dispatch(const std::string& command, const std::vector<std::string>& args,
                            const GlobalOptions& globals);
};

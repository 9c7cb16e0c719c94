#pragma once

#include <string>
#include <vector>

struct RunResult {
    bool spawned = false;   // false if fork/chdir/exec failed
    int exit_code = -1;     // exit status, or 128 + signal number
    std::string error;      // spawn failure description
};

struct CaptureResult {
    bool spawned = false;
    int exit_code = -1;
    std::string out;        // captured stdout
    std::string err;        // captured stderr
    std::string error;      // spawn failure description
};

class ProcessRunner {
public:
    /// Exit code reported when the child could not be started
    static constexpr int kSpawnFailure = 127;

    /// Run argv[0] (PATH lookup) with stdio inherited, in cwd (empty = current dir).
    /// Blocks until the child exits. SIGINT/SIGQUIT are ignored in the parent
    /// while waiting so the child alone decides how to handle an interrupt.
    static RunResult run(const std::vector<std::string>& argv, const std::string& cwd = "");

    /// Run argv[0] with stdout and stderr captured
    static CaptureResult capture(const std::vector<std::string>& argv, const std::string& cwd = "");

    /// Render argv as a shell-like command line (for logs and messages)
    static std::string format_command(const std::vector<std::string>& argv);

private:
    static int decode_status(int status);
};

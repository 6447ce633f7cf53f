#pragma once

#include <string>
#include <vector>

namespace reviser {

struct ProcLimits {
    int timeout_ms{30000};
    size_t output_max_bytes{1024 * 1024}; // stdout + stderr combined
};

// Seconds to a ProcLimits::timeout_ms value. Non-positive gives 0 (no
// timeout); large values saturate instead of overflowing.
int proc_timeout_ms(int seconds);

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout followed by stderr
    size_t stdout_bytes{0}; // output[0, stdout_bytes) came from stdout
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is resolved through PATH), capture stdout and
// stderr on separate pipes, enforce the timeout by killing the child's
// process group. Returns false when the process could not be started
// (pipe/fork failure, exec failure such as a missing binary); `res->error`
// then holds the reason. A timed-out child returns true with timed_out set.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

// Same, feeding `stdin_data` to the child. Writes and reads are interleaved
// with poll() so large payloads cannot deadlock on full pipes.
bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res);

// Split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace reviser

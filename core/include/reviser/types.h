#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace reviser {

// Outcome of one external checker invocation. `executed` is false only when
// the runner itself faulted (sandbox, missing target, spawn error, timeout);
// a tool that ran and exited non-zero is still executed=true.
struct ToolInvocationResult {
    bool executed{false};
    std::string raw_output;       // stdout followed by stderr
    std::string execution_error;  // set only when !executed
    int exit_code{-1};
    bool timed_out{false};

    bool exited_ok() const { return executed && exit_code == 0; }
};

// One static-analysis finding.
struct Violation {
    std::string message_id;  // e.g. "C0114"
    std::string symbol;      // e.g. "missing-module-docstring"
    std::string message;
    std::string type;        // convention / warning / error / ...
    std::string path;
    int line{0};
    int column{0};
};

struct AnalysisOutcome {
    double score{0.0};                 // out of 10, 0 when unknown
    std::vector<Violation> violations; // empty when the structured section did not parse
    std::string raw_output;
    std::string execution_error;
};

// Maximum number of failure excerpts handed to downstream stages.
constexpr size_t kMaxFailureExcerpts = 5;

struct TestOutcome {
    int collected{0};
    int passed_count{0};
    int failed_count{0};
    bool all_passed{false};
    std::vector<std::string> failure_excerpts; // at most kMaxFailureExcerpts
    bool collection_error{false};              // nothing collected and output mentions an import failure
    std::string raw_output;
    std::string execution_error;
};

} // namespace reviser

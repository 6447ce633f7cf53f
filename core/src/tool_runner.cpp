#include "reviser/tool_runner.h"
#include "reviser/proc.h"

#include <filesystem>

namespace reviser {

const char* const kTimeoutMarker = "\nTimeout reached.";

ToolInvocationResult SandboxedProcessRunner::run(const std::string& executable,
                                                 const std::vector<std::string>& args,
                                                 const std::string& working_target,
                                                 int timeout_seconds) const {
    namespace fs = std::filesystem;
    ToolInvocationResult r;

    fs::path target;
    std::string err;
    if (!guard_.check(working_target, &target, &err)) {
        r.execution_error = "sandbox violation: " + err;
        return r;
    }

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        r.execution_error = "target not found";
        return r;
    }
    fs::path cwd = fs::is_directory(target, ec) ? target : target.parent_path();

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(executable);
    argv.insert(argv.end(), args.begin(), args.end());

    ProcLimits lim;
    lim.timeout_ms = proc_timeout_ms(timeout_seconds);
    lim.output_max_bytes = output_max_bytes_;

    ProcResult pr;
    if (!proc_run_capture(argv, cwd.string(), lim, &pr)) {
        r.execution_error = pr.error;
        return r;
    }

    r.raw_output = std::move(pr.output);
    r.exit_code = pr.exit_code;
    if (pr.timed_out) {
        r.timed_out = true;
        r.execution_error = "timed out";
        r.raw_output += kTimeoutMarker;
        return r;
    }
    r.executed = true;
    return r;
}

} // namespace reviser

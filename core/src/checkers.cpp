#include "reviser/checkers.h"
#include "reviser/lint_report.h"
#include "reviser/test_report.h"

namespace reviser {

ToolCommand default_lint_command() {
    ToolCommand c;
    c.argv = {"python3", "-m", "pylint"};
    c.trailing_args = {"--output-format=json", "--score=yes"};
    c.timeout_sec = 30;
    return c;
}

ToolCommand default_test_command() {
    ToolCommand c;
    c.argv = {"python3", "-m", "pytest"};
    c.trailing_args = {"-v", "--tb=short", "--no-header"};
    c.timeout_sec = 60;
    return c;
}

std::vector<std::string> checker_argv(const ToolCommand& cmd, const std::string& target) {
    std::vector<std::string> av = cmd.argv;
    av.push_back(target);
    av.insert(av.end(), cmd.trailing_args.begin(), cmd.trailing_args.end());
    return av;
}

ToolInvocationResult invoke_checker(const SandboxedProcessRunner& runner,
                                    const ToolCommand& cmd,
                                    const std::string& target) {
    if (cmd.argv.empty()) {
        ToolInvocationResult r;
        r.execution_error = "no checker command configured";
        return r;
    }
    std::vector<std::string> av = checker_argv(cmd, target);
    std::vector<std::string> args(av.begin() + 1, av.end());
    return runner.run(av[0], args, target, cmd.timeout_sec);
}

AnalysisOutcome run_static_analysis(const SandboxedProcessRunner& runner,
                                    const ToolCommand& cmd,
                                    const std::string& file) {
    return analysis_from_invocation(invoke_checker(runner, cmd, file));
}

TestOutcome run_test_suite(const SandboxedProcessRunner& runner,
                           const ToolCommand& cmd,
                           const std::string& test_file) {
    return test_outcome_from_invocation(invoke_checker(runner, cmd, test_file));
}

} // namespace reviser

#pragma once
#include "tool_runner.h"
#include "types.h"

#include <string>
#include <vector>

namespace reviser {

// An external checker: argv prefix, the target file, then trailing flags.
//   lint:  python3 -m pylint <file> --output-format=json --score=yes
//   tests: python3 -m pytest <file> -v --tb=short --no-header
struct ToolCommand {
    std::vector<std::string> argv;
    std::vector<std::string> trailing_args;
    int timeout_sec{30};
};

ToolCommand default_lint_command();
ToolCommand default_test_command();

// Full argv for one target, argv[0] first.
std::vector<std::string> checker_argv(const ToolCommand& cmd, const std::string& target);

ToolInvocationResult invoke_checker(const SandboxedProcessRunner& runner,
                                    const ToolCommand& cmd,
                                    const std::string& target);

AnalysisOutcome run_static_analysis(const SandboxedProcessRunner& runner,
                                    const ToolCommand& cmd,
                                    const std::string& file);

TestOutcome run_test_suite(const SandboxedProcessRunner& runner,
                           const ToolCommand& cmd,
                           const std::string& test_file);

} // namespace reviser

#include "cmd_check.h"
#include "runner_utils.h"

#include "reviser/checkers.h"
#include "reviser/config.h"
#include "reviser/path_guard.h"
#include "reviser/test_report.h"
#include "reviser/tool_runner.h"
#include "reviser/unit_repository.h"

#include <iostream>
#include <string>

using namespace reviser;

int cmd_list(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: reviser_cli list <dir>\n";
        return 2;
    }
    ReviserConfig cfg = load_config(detect_profile());
    if (report_config_errors(cfg, false)) return 1;

    UnitRepository units{PathGuard(cfg.sandbox_root)};
    for (const auto& p : units.list(argv[2])) {
        std::cout << (units.is_validation_unit(p) ? "test   " : "source ") << p.string() << "\n";
    }
    return 0;
}

int cmd_lint(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: reviser_cli lint <file>\n";
        return 2;
    }
    ReviserConfig cfg = load_config(detect_profile());
    if (report_config_errors(cfg, false)) return 1;

    SandboxedProcessRunner runner(PathGuard(cfg.sandbox_root), cfg.output_max_bytes);
    AnalysisOutcome a = run_static_analysis(runner, cfg.lint, argv[2]);
    if (!a.execution_error.empty()) {
        std::cerr << "[lint] " << a.execution_error << "\n";
        if (a.raw_output.empty()) return 1;
    }
    std::cout << "score: " << a.score << "/10\n";
    for (const auto& v : a.violations) {
        std::cout << v.path << ":" << v.line << ":" << v.column << ": "
                  << v.message_id << " (" << v.symbol << ") " << v.message << "\n";
    }
    return a.execution_error.empty() ? 0 : 1;
}

int cmd_test(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: reviser_cli test <file>\n";
        return 2;
    }
    ReviserConfig cfg = load_config(detect_profile());
    if (report_config_errors(cfg, false)) return 1;

    SandboxedProcessRunner runner(PathGuard(cfg.sandbox_root), cfg.output_max_bytes);
    TestOutcome t = run_test_suite(runner, cfg.test, argv[2]);
    std::cout << "collected=" << t.collected << " passed=" << t.passed_count
              << " failed=" << t.failed_count << "\n";
    std::cout << summarize_test_outcome(t) << "\n";
    return t.all_passed ? 0 : 1;
}

#include "cmd_run.h"
#include "runner_utils.h"

#include "reviser/batch.h"
#include "reviser/collaborators.h"
#include "reviser/config.h"
#include "reviser/file_store.h"
#include "reviser/log.h"
#include "reviser/path_guard.h"
#include "reviser/revision.h"
#include "reviser/tool_runner.h"
#include "reviser/unit_repository.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace reviser;

static std::atomic<bool> g_run_cancel{false};

static int usage() {
    std::cerr << "usage: reviser_cli run <target_dir> [--workers N] [--max_iterations N]\n";
    std::cerr << "env: REVISER_SANDBOX_ROOT, REVISER_ANALYZE_CMD, REVISER_MUTATE_CMD, REVISER_TESTGEN_CMD,\n"
                 "     REVISER_LINT_CMD, REVISER_TEST_CMD, REVISER_PROFILE=dev|prod\n";
    return 2;
}

int cmd_run(int argc, char** argv) {
    std::string target;
    int workers = -1;
    int max_iterations = -1;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--workers" || a == "--max_iterations") {
            if (i + 1 >= argc) return usage();
            int* dst = (a == "--workers") ? &workers : &max_iterations;
            if (!parse_int_arg(argv[++i], 1, a == "--workers" ? 64 : 1000000, dst)) {
                std::cerr << "invalid value for " << a << ": " << argv[i] << "\n";
                return usage();
            }
        } else if (!a.empty() && a[0] == '-') {
            std::cerr << "unknown option: " << a << "\n";
            return usage();
        } else if (target.empty()) {
            target = a;
        } else {
            return usage();
        }
    }
    if (target.empty()) return usage();

    ReviserConfig cfg = load_config(detect_profile());
    if (workers > 0) cfg.workers = workers;
    if (max_iterations > 0) cfg.max_iterations = max_iterations;
    if (report_config_errors(cfg, true)) return 1;

    PathGuard guard(cfg.sandbox_root);
    std::filesystem::path target_dir;
    std::string err;
    if (!guard.check(target, &target_dir, &err)) {
        std::cerr << "[run] " << err << "\n";
        return 1;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(target_dir, ec)) {
        std::cerr << "[run] not a directory: " << target_dir.string() << "\n";
        return 1;
    }

    ConfinedFileStore store(guard);
    SandboxedProcessRunner runner(guard, cfg.output_max_bytes);
    UnitRepository units(guard);

    RunHeader hdr;
    hdr.run_id = gen_run_id();
    JsonlLogger log(hdr, resolve_log_path(cfg));
    if (!log.ok()) std::cerr << "[run] cannot open experiment log " << log.path() << "\n";

    ExternalAnalyzer analyzer(
        ExternalCommand("analyze", cfg.analyze_cmd, cfg.collab_timeout_sec, cfg.output_max_bytes),
        runner, cfg.lint);
    ExternalMutator mutator(
        ExternalCommand("mutate", cfg.mutate_cmd, cfg.collab_timeout_sec, cfg.output_max_bytes));
    std::unique_ptr<ExternalTestGenerator> generator;
    if (!cfg.testgen_cmd.empty()) {
        generator = std::make_unique<ExternalTestGenerator>(
            ExternalCommand("generate_tests", cfg.testgen_cmd, cfg.collab_timeout_sec, cfg.output_max_bytes),
            units);
    }
    ToolValidator validator(store, runner, cfg.test, units, generator.get(), &log);

    LoopOptions opts;
    opts.max_iterations = cfg.max_iterations;
    opts.stage_delay_ms = cfg.stage_delay_ms;
    RevisionLoop loop(analyzer, mutator, validator, store, opts, &log);

    std::signal(SIGTERM, [](int) { g_run_cancel.store(true); });
    std::signal(SIGINT,  [](int) { g_run_cancel.store(true); });

    std::cerr << "[run] run_id=" << hdr.run_id << " profile=" << profile_name(cfg.profile)
              << " workers=" << cfg.workers << " max_iterations=" << cfg.max_iterations
              << " log=" << log.path() << "\n";

    BatchRunner batch(units, store, loop, cfg.workers);
    BatchReport rep = batch.run(target_dir, &g_run_cancel);
    print_batch_report(std::cout, rep);
    return 0;
}

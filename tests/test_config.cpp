#include "test_common.h"
#include "reviser/config.h"

#include <cstdlib>
#include <string>

using namespace reviser;

static const char* kVars[] = {
    "REVISER_PROFILE", "REVISER_SANDBOX_ROOT", "REVISER_MAX_ITERATIONS", "REVISER_WORKERS",
    "REVISER_LINT_CMD", "REVISER_LINT_TIMEOUT_SEC", "REVISER_TEST_CMD", "REVISER_TEST_TIMEOUT_SEC",
    "REVISER_ANALYZE_CMD", "REVISER_MUTATE_CMD", "REVISER_TESTGEN_CMD", "REVISER_COLLAB_TIMEOUT_SEC",
    "REVISER_STAGE_DELAY_MS", "REVISER_OUTPUT_MAX_BYTES", "REVISER_LOG_PATH",
};

static void clear_env() {
    for (const char* k : kVars) unsetenv(k);
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    expect_true(detect_profile() == Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("REVISER_PROFILE", "prod", 1);
    expect_true(detect_profile() == Profile::PROD, "should detect PROD");
    setenv("REVISER_PROFILE", "Production", 1);
    expect_true(detect_profile() == Profile::PROD, "should detect PROD case-insensitive");
    setenv("REVISER_PROFILE", "staging", 1);
    expect_true(detect_profile() == Profile::DEV, "unknown profile falls back to DEV");
    unsetenv("REVISER_PROFILE");

    // Test 3: Defaults
    ReviserConfig c = load_config(Profile::DEV);
    expect_eq_str(c.sandbox_root, "./sandbox", "default sandbox");
    expect_eq_ll(c.max_iterations, 10, "default ceiling");
    expect_eq_ll(c.workers, 1, "default workers");
    expect_eq_ll(c.lint.timeout_sec, 30, "lint timeout");
    expect_eq_ll(c.test.timeout_sec, 60, "test timeout");
    expect_eq_ll(c.collab_timeout_sec, 120, "dev collaborator timeout");
    expect_eq_ll(c.stage_delay_ms, 0, "dev has no stage delay");
    expect_eq_ll((long long)c.output_max_bytes, 1024 * 1024, "output cap");
    expect_true(c.analyze_cmd.empty() && c.mutate_cmd.empty(), "no collaborators by default");

    ReviserConfig p = load_config(Profile::PROD);
    expect_eq_ll(p.collab_timeout_sec, 60, "prod collaborator timeout");
    expect_eq_ll(p.stage_delay_ms, 2000, "prod stage delay");

    // Test 4: Overrides
    setenv("REVISER_SANDBOX_ROOT", "/tmp/box", 1);
    setenv("REVISER_MAX_ITERATIONS", "4", 1);
    setenv("REVISER_WORKERS", "500", 1);
    setenv("REVISER_LINT_CMD", "ruff check", 1);
    setenv("REVISER_MUTATE_CMD", "python3 'my agent.py' --stage mutate", 1);
    setenv("REVISER_STAGE_DELAY_MS", "250", 1);
    setenv("REVISER_LOG_PATH", "/tmp/box-logs/x.jsonl", 1);
    c = load_config(Profile::PROD);
    expect_eq_str(c.sandbox_root, "/tmp/box", "sandbox override");
    expect_eq_ll(c.max_iterations, 4, "ceiling override");
    expect_eq_ll(c.workers, 64, "workers clamped");
    expect_eq_ll((long long)c.lint.argv.size(), 2, "lint argv split");
    expect_eq_str(c.lint.argv[0], "ruff", "lint exe");
    expect_eq_ll((long long)c.lint.trailing_args.size(), 2, "lint flags kept");
    expect_eq_ll((long long)c.mutate_cmd.size(), 4, "mutate argv split");
    expect_eq_str(c.mutate_cmd[1], "my agent.py", "quoted argument");
    expect_eq_ll(c.stage_delay_ms, 250, "delay override beats profile");
    expect_eq_str(resolve_log_path(c), "/tmp/box-logs/x.jsonl", "explicit log path");

    // Test 5: Malformed numbers keep defaults
    setenv("REVISER_MAX_ITERATIONS", "ten", 1);
    setenv("REVISER_WORKERS", "3x", 1);
    setenv("REVISER_OUTPUT_MAX_BYTES", "-5", 1);
    c = load_config(Profile::DEV);
    expect_eq_ll(c.max_iterations, 10, "malformed ceiling ignored");
    expect_eq_ll(c.workers, 1, "malformed workers ignored");
    expect_eq_ll((long long)c.output_max_bytes, 1024 * 1024, "non-positive cap ignored");

    // Test 6: Validation
    auto errs = validate_config(c, false);
    expect_true(errs.empty(), "checker-only config valid");
    errs = validate_config(c, true);
    expect_eq_ll((long long)errs.size(), 1, "run needs analyze (mutate is set)");
    c.max_iterations = 0;
    c.test.argv.clear();
    errs = validate_config(c, false);
    expect_eq_ll((long long)errs.size(), 2, "ceiling and test command reported");

    // Test 6b: Timeouts are bounded so the ms conversion cannot overflow
    c = load_config(Profile::DEV);
    c.test.timeout_sec = kMaxTimeoutSec + 1;
    errs = validate_config(c, false);
    expect_eq_ll((long long)errs.size(), 1, "oversized test timeout rejected");
    expect_true(errs[0].find("REVISER_TEST_TIMEOUT_SEC") != std::string::npos, "names the setting");
    c.test.timeout_sec = kMaxTimeoutSec;
    c.collab_timeout_sec = 3000000;
    c.analyze_cmd = {"an"};
    c.mutate_cmd = {"mu"};
    errs = validate_config(c, true);
    expect_eq_ll((long long)errs.size(), 1, "oversized collaborator timeout rejected");

    // Test 7: Default log path sits beside the sandbox
    clear_env();
    c = load_config(Profile::DEV);
    c.sandbox_root = "/srv/work/sandbox/";
    expect_eq_str(resolve_log_path(c), "/srv/work/logs/experiment_data.jsonl", "default log path");

    // Test 8: Profile name
    expect_eq_str(profile_name(Profile::DEV), "dev", "dev name");
    expect_eq_str(profile_name(Profile::PROD), "prod", "prod name");

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}

#include "test_common.h"
#include "reviser/checkers.h"
#include "reviser/tool_runner.h"

#include <filesystem>
#include <string>

using namespace reviser;
namespace fs = std::filesystem;

static void test_non_zero_exit_is_executed(const SandboxedProcessRunner& runner, const fs::path& root) {
    fs::path target = root / "pkg" / "mod.py";
    write_text(target, "x = 1\n");
    ToolInvocationResult r = runner.run("/bin/sh", {"-c", "echo report; echo warn >&2; exit 4"}, target.string(), 10);
    expect_true(r.executed, "non-zero exit still executed");
    expect_eq_ll(r.exit_code, 4, "exit code kept");
    expect_true(!r.exited_ok(), "not ok");
    expect_eq_str(r.raw_output, "report\nwarn\n", "stdout then stderr");
    expect_true(r.execution_error.empty(), "no execution error");
}

static void test_cwd_is_target_dir(const SandboxedProcessRunner& runner, const fs::path& root) {
    fs::path target = root / "pkg" / "mod.py";
    write_text(target, "x = 1\n");
    ToolInvocationResult r = runner.run("/bin/sh", {"-c", "pwd"}, target.string(), 10);
    expect_true(r.executed, "pwd ran");
    expect_eq_str(r.raw_output, (root / "pkg").string() + "\n", "file target runs in its parent");

    r = runner.run("/bin/sh", {"-c", "pwd"}, (root / "pkg").string(), 10);
    expect_eq_str(r.raw_output, (root / "pkg").string() + "\n", "directory target runs in itself");
}

static void test_outside_target_never_spawns(const SandboxedProcessRunner& runner, const fs::path& base) {
    fs::path marker = base / "spawned";
    write_text(base / "outside.py", "x = 1\n");
    ToolInvocationResult r = runner.run("/bin/sh", {"-c", "touch " + marker.string()},
                                        (base / "outside.py").string(), 10);
    expect_true(!r.executed, "outside target not executed");
    expect_true(r.execution_error.find("sandbox violation") == 0, "violation reported: " + r.execution_error);
    expect_true(!fs::exists(marker), "nothing spawned");
}

static void test_missing_target(const SandboxedProcessRunner& runner, const fs::path& root) {
    ToolInvocationResult r = runner.run("/bin/sh", {"-c", "true"}, (root / "nope.py").string(), 10);
    expect_true(!r.executed, "missing target not executed");
    expect_eq_str(r.execution_error, "target not found", "missing target error");
}

static void test_missing_binary(const SandboxedProcessRunner& runner, const fs::path& root) {
    write_text(root / "a.py", "x = 1\n");
    ToolInvocationResult r = runner.run("reviser-no-such-checker", {}, (root / "a.py").string(), 10);
    expect_true(!r.executed, "missing binary not executed");
    expect_true(!r.execution_error.empty(), "OS error text present");
}

static void test_timeout(const SandboxedProcessRunner& runner, const fs::path& root) {
    write_text(root / "slow.py", "x = 1\n");
    ToolInvocationResult r = runner.run("/bin/sh", {"-c", "echo started; sleep 10"}, (root / "slow.py").string(), 1);
    expect_true(!r.executed, "timed out run is not executed");
    expect_true(r.timed_out, "timed_out flag");
    expect_eq_str(r.execution_error, "timed out", "timeout error text");
    expect_true(r.raw_output.find("started") == 0, "partial output kept");
    expect_true(r.raw_output.find(kTimeoutMarker) != std::string::npos, "timeout marker appended");
}

static void test_checker_argv_layout() {
    ToolCommand lint = default_lint_command();
    auto av = checker_argv(lint, "/s/a.py");
    expect_eq_ll((long long)av.size(), 6, "lint argv size");
    expect_eq_str(av[0], "python3", "lint exe");
    expect_eq_str(av[3], "/s/a.py", "target after prefix");
    expect_eq_str(av[4], "--output-format=json", "json output flag");
    expect_eq_ll(lint.timeout_sec, 30, "lint timeout");

    ToolCommand test = default_test_command();
    av = checker_argv(test, "/s/test_a.py");
    expect_eq_str(av[2], "pytest", "test module");
    expect_eq_str(av[av.size() - 1], "--no-header", "last test flag");
    expect_eq_ll(test.timeout_sec, 60, "test timeout");
}

int main() {
    fs::path base = fresh_dir("tool_runner");
    fs::path root = base / "sandbox";
    fs::create_directories(root);
    SandboxedProcessRunner runner{PathGuard(root)};

    test_non_zero_exit_is_executed(runner, root);
    test_cwd_is_target_dir(runner, root);
    test_outside_target_never_spawns(runner, base);
    test_missing_target(runner, root);
    test_missing_binary(runner, root);
    test_timeout(runner, root);
    test_checker_argv_layout();

    std::error_code ec;
    fs::remove_all(base, ec);
    std::cerr << "test_tool_runner: ALL PASSED" << std::endl;
    return 0;
}

#include "test_common.h"
#include "reviser/lint_report.h"

#include <string>

using namespace reviser;

static const char* kPylintOutput =
    "[\n"
    "    {\n"
    "        \"type\": \"convention\",\n"
    "        \"module\": \"calc\",\n"
    "        \"obj\": \"\",\n"
    "        \"line\": 1,\n"
    "        \"column\": 0,\n"
    "        \"path\": \"calc.py\",\n"
    "        \"symbol\": \"missing-module-docstring\",\n"
    "        \"message\": \"Missing module docstring\",\n"
    "        \"message-id\": \"C0114\"\n"
    "    },\n"
    "    {\n"
    "        \"type\": \"error\",\n"
    "        \"line\": 7,\n"
    "        \"column\": 11,\n"
    "        \"path\": \"calc.py\",\n"
    "        \"symbol\": \"undefined-variable\",\n"
    "        \"message\": \"Undefined variable 'reslt'\",\n"
    "        \"message-id\": \"E0602\"\n"
    "    }\n"
    "]\n"
    "------------------------------------------------------------------\n"
    "Your code has been rated at 4.29/10 (previous run: 3.00/10, +1.29)\n";

static void test_full_report() {
    AnalysisOutcome a = parse_analysis_output(kPylintOutput);
    expect_eq_ll((long long)a.violations.size(), 2, "two violations");
    expect_eq_str(a.violations[0].message_id, "C0114", "first id");
    expect_eq_str(a.violations[0].symbol, "missing-module-docstring", "first symbol");
    expect_eq_str(a.violations[1].message, "Undefined variable 'reslt'", "second message");
    expect_eq_ll(a.violations[1].line, 7, "second line");
    expect_eq_ll(a.violations[1].column, 11, "second column");
    expect_true(a.score > 4.28 && a.score < 4.30, "score parsed");
    expect_eq_str(a.raw_output, kPylintOutput, "raw output preserved");
}

static void test_extractions_are_independent() {
    // broken JSON, good score line
    std::string broken = "[{\"message-id\": \"C0114\", \n\nYour code has been rated at 7.50/10\n";
    bool parsed = true;
    auto v = parse_violations(broken, &parsed);
    expect_true(!parsed, "broken json not parsed");
    expect_true(v.empty(), "broken json gives no violations");
    expect_true(parse_quality_score(broken) == 7.5, "score survives broken json");

    // good JSON, no score line
    std::string no_score = "[{\"message-id\": \"W0611\", \"symbol\": \"unused-import\", \"message\": \"Unused import os\"}]\n";
    AnalysisOutcome a = parse_analysis_output(no_score);
    expect_eq_ll((long long)a.violations.size(), 1, "violation without score line");
    expect_true(a.score == 0.0, "missing score is 0");
}

static void test_empty_array_and_perfect_score() {
    AnalysisOutcome a = parse_analysis_output("[]\n\n--------\nYour code has been rated at 10.00/10\n");
    expect_true(a.violations.empty(), "empty array");
    expect_true(a.score == 10.0, "perfect score");
}

static void test_malformed_score() {
    expect_true(parse_quality_score("Your code has been rated at abc/10\n") == 0.0, "non-numeric score");
    expect_true(parse_quality_score("Your code has been rated at 5.5\n") == 0.0, "missing slash");
    expect_true(parse_quality_score("") == 0.0, "empty output");
    expect_true(parse_quality_score("Your code has been rated at -2.50/10\n") == -2.5, "negative scores exist");
}

static void test_noise_before_json() {
    std::string noisy = "************* Module calc\nsome warning [not json\n[{\"message-id\": \"R1705\"}]\n";
    bool parsed = false;
    auto v = parse_violations(noisy, &parsed);
    expect_true(parsed, "array on a later line found");
    expect_eq_ll((long long)v.size(), 1, "one violation after noise");
    expect_eq_str(v[0].message_id, "R1705", "id after noise");
}

static void test_from_invocation() {
    ToolInvocationResult inv;
    inv.executed = false;
    inv.execution_error = "timed out";
    inv.raw_output = "[]\n";
    AnalysisOutcome a = analysis_from_invocation(inv);
    expect_eq_str(a.execution_error, "timed out", "execution error carried");
    expect_true(a.violations.empty() && a.score == 0.0, "defaults");

    inv.executed = true;
    inv.exit_code = 16; // pylint exit codes are bit flags, not failures
    inv.execution_error.clear();
    inv.raw_output = kPylintOutput;
    a = analysis_from_invocation(inv);
    expect_true(a.execution_error.empty(), "non-zero exit is not an execution error");
    expect_eq_ll((long long)a.violations.size(), 2, "violations from invocation");
}

int main() {
    test_full_report();
    test_extractions_are_independent();
    test_empty_array_and_perfect_score();
    test_malformed_score();
    test_noise_before_json();
    test_from_invocation();

    std::cerr << "test_lint_report: ALL PASSED" << std::endl;
    return 0;
}

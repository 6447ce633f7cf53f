#include "test_common.h"
#include "reviser/revision.h"

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace reviser;
namespace fs = std::filesystem;

namespace {

struct FakeAnalyzer : IAnalyzer {
    int calls{0};
    bool fail{false};
    std::string analyze(const std::string&, const std::string& content) override {
        calls++;
        if (fail) throw CollaboratorFault("analyzer offline");
        return "findings for " + std::to_string(content.size()) + " bytes";
    }
};

// Returns "v<n>\n" on call n unless a hook says otherwise.
struct FakeMutator : IMutator {
    int calls{0};
    std::vector<std::string> seen_findings;
    std::vector<std::optional<std::string>> seen_summaries;
    std::function<std::string(int)> hook;
    std::string mutate(const std::string&, const std::string&, const std::string& findings,
                       const std::optional<std::string>& prior) override {
        calls++;
        seen_findings.push_back(findings);
        seen_summaries.push_back(prior);
        if (hook) return hook(calls);
        return "v" + std::to_string(calls) + "\n";
    }
};

// Fails until call `pass_on`; 0 never passes.
struct FakeValidator : IValidator {
    int calls{0};
    int pass_on{0};
    std::vector<std::string> seen_content;
    std::function<void(int)> hook;
    TestOutcome validate(const std::string&, const std::string& content, const std::string&) override {
        calls++;
        seen_content.push_back(content);
        if (hook) hook(calls);
        TestOutcome t;
        if (pass_on > 0 && calls >= pass_on) {
            t.passed_count = t.collected = 3;
            t.all_passed = true;
        } else {
            t.passed_count = 2;
            t.failed_count = 1;
            t.collected = 3;
            t.failure_excerpts.push_back("FAILED t.py::test_c\nE   assert 1 == 2");
        }
        return t;
    }
};

struct Fixture {
    fs::path root;
    ConfinedFileStore store;
    fs::path item;
    FakeAnalyzer analyzer;
    FakeMutator mutator;
    FakeValidator validator;

    explicit Fixture(const fs::path& r) : root(r), store(PathGuard(r)), item(r / "calc.py") {
        write_text(item, "orig\n");
    }

    RevisionState run(int ceiling, const std::atomic<bool>* cancel = nullptr, JsonlLogger* log = nullptr) {
        LoopOptions o;
        o.max_iterations = ceiling;
        RevisionLoop loop(analyzer, mutator, validator, store, o, log);
        return loop.run(item.string(), "orig\n", cancel);
    }
};

} // namespace

static void test_never_passing_hits_ceiling(const fs::path& root) {
    Fixture f(root);
    RevisionState st = f.run(10);
    expect_true(st.status == RevisionStatus::MAX_ITERATIONS, "ends at max_iterations");
    expect_eq_ll(st.iteration, 10, "iteration stops at the ceiling");
    expect_eq_ll(f.mutator.calls, 10, "exactly ten mutations");
    expect_eq_ll(f.validator.calls, 10, "exactly ten validations");
    expect_eq_ll(f.analyzer.calls, 1, "analyze once");
    expect_true(st.validation_summary.has_value(), "summary set");
    expect_true(st.validation_summary->rfind("Failed 1/3 tests:", 0) == 0, "failure summary");
}

static void test_success_on_third(const fs::path& root) {
    Fixture f(root);
    f.validator.pass_on = 3;
    RevisionState st = f.run(10);
    expect_true(st.status == RevisionStatus::SUCCESS, "success");
    expect_eq_ll(st.iteration, 3, "iteration 3");
    expect_eq_ll(f.mutator.calls, 3, "three mutations");
    expect_eq_str(st.current_content, "v3\n", "latest content kept");
    expect_eq_str(read_text(f.item), "v3\n", "latest content committed");
    expect_eq_str(st.original_content, "orig\n", "original untouched");
    expect_eq_str(*st.validation_summary, "All 3 tests passed", "success summary");
}

static void test_summary_feeds_next_mutation(const fs::path& root) {
    Fixture f(root);
    f.validator.pass_on = 2;
    (void)f.run(10);
    expect_true(!f.mutator.seen_summaries[0].has_value(), "first mutation has no prior summary");
    expect_true(f.mutator.seen_summaries[1].has_value(), "second mutation sees the summary");
    expect_true(f.mutator.seen_summaries[1]->find("assert 1 == 2") != std::string::npos, "excerpt forwarded");
    expect_eq_str(f.mutator.seen_findings[1], f.mutator.seen_findings[0], "findings carried across retries");
}

static void test_mutate_fault_keeps_content(const fs::path& root) {
    Fixture f(root);
    f.validator.pass_on = 3;
    f.mutator.hook = [](int n) -> std::string {
        if (n == 2) throw CollaboratorFault("mutator offline");
        return "v" + std::to_string(n) + "\n";
    };
    RevisionState st = f.run(10);
    expect_eq_str(f.validator.seen_content[1], "v1\n", "failed mutation keeps previous content");
    expect_true(st.status == RevisionStatus::SUCCESS, "loop continues after a mutate fault");
    expect_eq_str(st.current_content, "v3\n", "later mutation applies");

    Fixture g(root);
    g.mutator.hook = [](int) -> std::string { throw std::runtime_error("always down"); };
    st = g.run(2);
    expect_eq_str(st.current_content, "orig\n", "content never nulled");
    expect_eq_str(read_text(g.item), "orig\n", "file untouched");
    expect_true(st.last_error.find("always down") != std::string::npos, "last error recorded");
    expect_eq_ll(g.validator.calls, 2, "validate still runs after each mutate fault");
}

static void test_earlier_fault_not_carried(const fs::path& root) {
    Fixture f(root);
    f.mutator.hook = [](int n) -> std::string {
        if (n == 1) throw CollaboratorFault("mutator offline");
        return "v" + std::to_string(n) + "\n";
    };
    RevisionState st = f.run(3);
    expect_true(st.status == RevisionStatus::MAX_ITERATIONS, "never passes");
    expect_eq_str(st.last_error, "", "round 1 fault cleared by later clean rounds");

    Fixture g(root);
    g.mutator.hook = [](int n) -> std::string {
        if (n == 3) throw CollaboratorFault("mutator offline");
        return "v" + std::to_string(n) + "\n";
    };
    st = g.run(3);
    expect_true(st.last_error.find("mutator offline") != std::string::npos, "final round fault kept");
}

static void test_empty_mutation_is_a_fault(const fs::path& root) {
    Fixture f(root);
    f.mutator.hook = [](int) { return std::string(); };
    RevisionState st = f.run(1);
    expect_eq_str(st.current_content, "orig\n", "empty output rejected");
    expect_eq_str(read_text(f.item), "orig\n", "empty output not committed");
    expect_true(st.status == RevisionStatus::MAX_ITERATIONS, "ceiling 1 stops after one round");
}

static void test_commit_failure_keeps_content(const fs::path& base) {
    fs::path root = base / "inner";
    fs::create_directories(root);
    Fixture f(root);
    // item outside the store's sandbox: every commit is refused
    f.item = base / "outside.py";
    write_text(f.item, "orig\n");
    RevisionState st = f.run(2);
    expect_eq_str(st.current_content, "orig\n", "refused commit keeps content");
    expect_eq_str(read_text(f.item), "orig\n", "outside file untouched");
    expect_true(st.last_error.find("commit failed") != std::string::npos, "commit failure recorded");
}

static void test_analyze_fault_marker(const fs::path& root) {
    Fixture f(root);
    f.analyzer.fail = true;
    f.validator.pass_on = 1;
    RevisionState st = f.run(10);
    expect_eq_str(st.findings, "ERROR: Analysis failed - analyzer offline", "error marker as findings");
    expect_eq_str(f.mutator.seen_findings[0], st.findings, "mutate still runs with the marker");
    expect_true(st.status == RevisionStatus::SUCCESS, "loop unaffected");
}

static void test_validate_fault_retries(const fs::path& root) {
    Fixture f(root);
    f.validator.pass_on = 2;
    f.validator.hook = [](int n) {
        if (n == 1) throw CollaboratorFault("runner crashed");
    };
    RevisionState st = f.run(10);
    expect_true(st.status == RevisionStatus::SUCCESS, "retry after validate fault");
    expect_eq_ll(st.iteration, 2, "fault consumed one iteration");
    expect_true(f.mutator.seen_summaries[1].has_value() &&
                *f.mutator.seen_summaries[1] == "Test execution error: runner crashed",
                "fault summary forwarded");

    Fixture g(root);
    g.validator.hook = [](int) { throw std::runtime_error("down"); };
    st = g.run(3);
    expect_true(st.status == RevisionStatus::MAX_ITERATIONS, "persistent validate fault ends at ceiling");
    expect_eq_ll(st.iteration, 3, "bounded");
}

struct ZeroCollected : IValidator {
    int calls{0};
    TestOutcome validate(const std::string&, const std::string&, const std::string&) override {
        calls++;
        return TestOutcome{};
    }
};

static void test_zero_collected_counts_toward_ceiling(const fs::path& root) {
    ConfinedFileStore store{PathGuard(root)};
    FakeAnalyzer a;
    FakeMutator m;
    ZeroCollected v;
    LoopOptions o;
    o.max_iterations = 4;
    RevisionLoop loop(a, m, v, store, o);
    RevisionState st = loop.run((root / "z.py").string(), "orig\n");
    expect_true(st.status == RevisionStatus::MAX_ITERATIONS, "zero collected never succeeds");
    expect_eq_ll(v.calls, 4, "zero collected consumes iterations");
    expect_eq_str(*st.validation_summary, "No tests collected - possible import error", "zero summary");
}

static void test_cancellation(const fs::path& root) {
    std::atomic<bool> cancel{true};
    Fixture f(root);
    RevisionState st = f.run(10, &cancel);
    expect_true(st.status == RevisionStatus::ABANDONED, "pre-cancelled item abandoned");
    expect_eq_ll(f.analyzer.calls, 0, "no stage ran");

    cancel = false;
    Fixture g(root);
    g.mutator.hook = [&cancel](int n) {
        if (n == 2) cancel = true;
        return "v" + std::to_string(n) + "\n";
    };
    st = g.run(10, &cancel);
    expect_true(st.status == RevisionStatus::ABANDONED, "cancelled mid-run");
    expect_eq_ll(g.validator.calls, 1, "no validation after the cancel point");
    expect_eq_ll(st.iteration, 2, "iteration where it stopped");
}

static void test_experiment_log(const fs::path& root) {
    fs::path log_path = root / "logs" / "exp.jsonl";
    RunHeader hdr;
    hdr.run_id = "r1";
    JsonlLogger log(hdr, log_path.string());

    Fixture f(root);
    f.validator.pass_on = 2;
    (void)f.run(10, nullptr, &log);

    std::string body = read_text(log_path);
    int lines = 0;
    for (char c : body) lines += (c == '\n');
    expect_eq_ll(lines, 5, "analyze + 2 x (mutate, validate)");
    expect_true(body.find("\"agent\":\"Auditor\"") != std::string::npos, "auditor event");
    expect_true(body.find("\"agent\":\"Fixer\"") != std::string::npos, "fixer event");
    expect_true(body.find("\"action\":\"DEBUG\"") != std::string::npos, "judge event");
    expect_true(body.find("\"status\":\"FAILURE\"") != std::string::npos, "failed validation logged");
}

int main() {
    fs::path base = fresh_dir("revision");
    fs::path root = base / "sandbox";
    fs::create_directories(root);

    test_never_passing_hits_ceiling(root);
    test_success_on_third(root);
    test_summary_feeds_next_mutation(root);
    test_mutate_fault_keeps_content(root);
    test_earlier_fault_not_carried(root);
    test_empty_mutation_is_a_fault(root);
    test_commit_failure_keeps_content(base);
    test_analyze_fault_marker(root);
    test_validate_fault_retries(root);
    test_zero_collected_counts_toward_ceiling(root);
    test_cancellation(root);
    test_experiment_log(root);

    expect_eq_str(revision_status_name(RevisionStatus::MAX_ITERATIONS), "max_iterations", "status name");

    std::error_code ec;
    fs::remove_all(base, ec);
    std::cerr << "test_revision: ALL PASSED" << std::endl;
    return 0;
}

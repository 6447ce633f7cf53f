#include "reviser/collaborators.h"
#include "reviser/json_mini.h"
#include "reviser/proc.h"

#include <json-c/json.h>

#include <filesystem>
#include <iostream>
#include <utility>

namespace reviser {

static std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
    size_t i=0;
    while (i<s.size() && (s[i]=='\n' || s[i]=='\r' || s[i]==' ' || s[i]=='\t')) i++;
    if (i) s.erase(0,i);
    return s;
}

// RAII guard for a request root.
struct JsonGuard {
    json_object* o;
    ~JsonGuard() { if (o) json_object_put(o); }
};

// ---- ExternalCommand ----

ExternalCommand::ExternalCommand(std::string label,
                                 std::vector<std::string> argv,
                                 int timeout_sec,
                                 size_t output_max_bytes,
                                 std::string cwd)
    : label_(std::move(label)),
      argv_(std::move(argv)),
      timeout_sec_(timeout_sec),
      output_max_bytes_(output_max_bytes),
      cwd_(std::move(cwd)) {}

std::string ExternalCommand::invoke(const std::string& request_json) const {
    if (argv_.empty()) throw CollaboratorFault(label_ + ": no command configured");

    ProcLimits lim;
    lim.timeout_ms = proc_timeout_ms(timeout_sec_);
    lim.output_max_bytes = output_max_bytes_;

    ProcResult pr;
    if (!proc_run_capture_stdin(argv_, cwd_, request_json, lim, &pr)) {
        throw CollaboratorFault(label_ + ": " + (pr.error.empty() ? "not started" : pr.error));
    }
    if (pr.timed_out) {
        throw CollaboratorFault(label_ + ": timed out after " + std::to_string(timeout_sec_) + " s");
    }
    if (pr.exit_code != 0) {
        std::string err = trim_ws(pr.output.substr(pr.stdout_bytes));
        if (err.size() > 300) err.resize(300);
        throw CollaboratorFault(label_ + ": exit_code=" + std::to_string(pr.exit_code) +
                                (err.empty() ? "" : " (" + err + ")"));
    }
    // a cut-off answer may end mid code block; never hand it to a stage
    if (pr.output_truncated) {
        throw CollaboratorFault(label_ + ": output truncated at " + std::to_string(output_max_bytes_) + " bytes");
    }
    std::string out = trim_ws(pr.output.substr(0, pr.stdout_bytes));
    if (out.empty()) throw CollaboratorFault(label_ + ": empty output");
    return out;
}

// ---- code block extraction ----

static std::string fenced_body(const std::string& text, size_t fence_pos) {
    size_t body = text.find('\n', fence_pos);
    if (body == std::string::npos) return {};
    body += 1;
    size_t close = text.find("```", body);
    if (close == std::string::npos) close = text.size();
    return trim_ws(text.substr(body, close - body));
}

std::string extract_code_block(const std::string& text, const std::string& lang) {
    if (!lang.empty()) {
        const std::string tagged = "```" + lang;
        for (size_t pos = text.find(tagged); pos != std::string::npos; pos = text.find(tagged, pos + 1)) {
            size_t after = pos + tagged.size();
            if (after == text.size() || text[after] == '\n' || text[after] == '\r' ||
                text[after] == ' ' || text[after] == '\t') {
                return fenced_body(text, pos);
            }
        }
    }
    size_t any = text.find("```");
    if (any != std::string::npos) return fenced_body(text, any);
    return trim_ws(text);
}

// ---- ExternalAnalyzer ----

ExternalAnalyzer::ExternalAnalyzer(ExternalCommand cmd, const SandboxedProcessRunner& runner, ToolCommand lint)
    : cmd_(std::move(cmd)), runner_(runner), lint_(std::move(lint)) {}

std::string ExternalAnalyzer::analyze(const std::string& item_id, const std::string& content) {
    AnalysisOutcome a = run_static_analysis(runner_, lint_, item_id);
    if (!a.execution_error.empty()) {
        std::cerr << "[collab] lint of " << item_id << " did not run cleanly: " << a.execution_error << "\n";
    }

    json_object* root = json_object_new_object();
    JsonGuard g{root};
    json_object_object_add(root, "stage", json_object_new_string("analyze"));
    json_mini::add_string(root, "item", item_id);
    json_mini::add_string(root, "content", content);

    json_object* lint = json_object_new_object();
    json_object_object_add(lint, "score", json_object_new_double(a.score));
    json_mini::add_string(lint, "raw_output", a.raw_output);
    if (!a.execution_error.empty()) json_mini::add_string(lint, "execution_error", a.execution_error);
    json_object* arr = json_object_new_array();
    for (const auto& v : a.violations) {
        json_object* o = json_object_new_object();
        json_mini::add_string(o, "message-id", v.message_id);
        json_mini::add_string(o, "symbol", v.symbol);
        json_mini::add_string(o, "message", v.message);
        json_mini::add_string(o, "type", v.type);
        json_object_object_add(o, "line", json_object_new_int(v.line));
        json_object_object_add(o, "column", json_object_new_int(v.column));
        json_object_array_add(arr, o);
    }
    json_object_object_add(lint, "violations", arr);
    json_object_object_add(root, "lint", lint);

    return cmd_.invoke(json_mini::to_string_plain(root));
}

// ---- ExternalMutator ----

ExternalMutator::ExternalMutator(ExternalCommand cmd, std::string lang)
    : cmd_(std::move(cmd)), lang_(std::move(lang)) {}

std::string ExternalMutator::mutate(const std::string& item_id,
                                    const std::string& content,
                                    const std::string& findings,
                                    const std::optional<std::string>& prior_validation_summary) {
    json_object* root = json_object_new_object();
    JsonGuard g{root};
    json_object_object_add(root, "stage", json_object_new_string("mutate"));
    json_mini::add_string(root, "item", item_id);
    json_mini::add_string(root, "content", content);
    json_mini::add_string(root, "findings", findings);
    if (prior_validation_summary) json_mini::add_string(root, "validation_summary", *prior_validation_summary);

    std::string code = extract_code_block(cmd_.invoke(json_mini::to_string_plain(root)), lang_);
    if (code.empty()) throw CollaboratorFault(cmd_.label() + ": response holds no code");
    return code + "\n";
}

// ---- ExternalTestGenerator ----

ExternalTestGenerator::ExternalTestGenerator(ExternalCommand cmd, const UnitRepository& units, std::string lang)
    : cmd_(std::move(cmd)), units_(units), lang_(std::move(lang)) {}

std::string ExternalTestGenerator::generate(const std::string& item_id,
                                            const std::string& content,
                                            const std::string& findings) {
    std::filesystem::path src(item_id);

    json_object* root = json_object_new_object();
    JsonGuard g{root};
    json_object_object_add(root, "stage", json_object_new_string("generate_tests"));
    json_mini::add_string(root, "item", item_id);
    json_mini::add_string(root, "content", content);
    json_mini::add_string(root, "findings", findings);
    json_mini::add_string(root, "test_file", units_.validation_unit_for(src).string());
    json_mini::add_string(root, "module", src.stem().string());

    std::string code = extract_code_block(cmd_.invoke(json_mini::to_string_plain(root)), lang_);
    if (code.empty()) throw CollaboratorFault(cmd_.label() + ": response holds no code");
    return code + "\n";
}

// ---- ToolValidator ----

ToolValidator::ToolValidator(const ConfinedFileStore& store,
                             const SandboxedProcessRunner& runner,
                             ToolCommand test_cmd,
                             const UnitRepository& units,
                             ITestGenerator* generator,
                             JsonlLogger* log)
    : store_(store),
      runner_(runner),
      test_cmd_(std::move(test_cmd)),
      units_(units),
      generator_(generator),
      log_(log) {}

TestOutcome ToolValidator::validate(const std::string& item_id,
                                    const std::string& content,
                                    const std::string& findings) {
    const std::string test_path = units_.validation_unit_for(item_id).string();

    std::error_code ec;
    if (generator_ && !std::filesystem::exists(test_path, ec)) {
        generate_unit(item_id, test_path, content, findings);
    }
    return run_test_suite(runner_, test_cmd_, test_path);
}

// Generation problems are reported but never stop validation: the test run
// that follows reports the missing unit in its own outcome.
void ToolValidator::generate_unit(const std::string& item_id,
                                  const std::string& test_path,
                                  const std::string& content,
                                  const std::string& findings) {
    std::string err;
    try {
        std::string src = generator_->generate(item_id, content, findings);
        WriteOutcome w = store_.write(test_path, src);
        if (!w.ok()) err = "cannot write " + test_path + ": " + w.error;
    } catch (const std::exception& e) {
        err = e.what();
    }

    if (err.empty()) {
        std::cerr << "[collab] generated " << test_path << "\n";
    } else {
        std::cerr << "[collab] test generation for " << item_id << " failed: " << err << "\n";
    }
    if (log_) {
        std::string payload = err.empty()
            ? "{\"test_file\":\"" + json_mini::json_escape(test_path) + "\"}"
            : "{\"error\":\"" + json_mini::json_escape(err) + "\"}";
        // iteration 0: generation is not tied to one Mutate/Validate round
        log_->event(item_id, 0, "Judge", ActionType::GENERATION, err.empty(), payload);
    }
}

} // namespace reviser

#pragma once

// Stage collaborators backed by external commands.
//
// Each stage sends one JSON request on the command's stdin and takes its
// stdout as the answer:
//   {"stage":"analyze",        "item":..., "content":..., "lint":{...}}
//   {"stage":"mutate",         "item":..., "content":..., "findings":..., "validation_summary":...}
//   {"stage":"generate_tests", "item":..., "content":..., "findings":..., "test_file":..., "module":...}
// What the command does with it (which model, which prompt) is its own
// business. Launch failure, timeout, non-zero exit and empty stdout all
// raise CollaboratorFault.

#include "checkers.h"
#include "file_store.h"
#include "log.h"
#include "revision.h"
#include "tool_runner.h"
#include "unit_repository.h"

#include <optional>
#include <string>
#include <vector>

namespace reviser {

class ExternalCommand {
public:
    ExternalCommand(std::string label,
                    std::vector<std::string> argv,
                    int timeout_sec,
                    size_t output_max_bytes = 1024 * 1024,
                    std::string cwd = {});

    // Returns trimmed stdout; throws CollaboratorFault.
    std::string invoke(const std::string& request_json) const;

    bool configured() const { return !argv_.empty(); }
    const std::string& label() const { return label_; }

private:
    std::string label_;
    std::vector<std::string> argv_;
    int timeout_sec_;
    size_t output_max_bytes_;
    std::string cwd_;
};

// First fenced block of `text`: a fence tagged `lang` wins over an untagged
// one; with no fence at all the whole text is used. Result is trimmed.
std::string extract_code_block(const std::string& text, const std::string& lang = "python");

class ExternalAnalyzer : public IAnalyzer {
public:
    ExternalAnalyzer(ExternalCommand cmd, const SandboxedProcessRunner& runner, ToolCommand lint);

    std::string analyze(const std::string& item_id, const std::string& content) override;

private:
    ExternalCommand cmd_;
    const SandboxedProcessRunner& runner_;
    ToolCommand lint_;
};

class ExternalMutator : public IMutator {
public:
    explicit ExternalMutator(ExternalCommand cmd, std::string lang = "python");

    std::string mutate(const std::string& item_id,
                       const std::string& content,
                       const std::string& findings,
                       const std::optional<std::string>& prior_validation_summary) override;

private:
    ExternalCommand cmd_;
    std::string lang_;
};

class ExternalTestGenerator : public ITestGenerator {
public:
    ExternalTestGenerator(ExternalCommand cmd, const UnitRepository& units, std::string lang = "python");

    std::string generate(const std::string& item_id,
                         const std::string& content,
                         const std::string& findings) override;

private:
    ExternalCommand cmd_;
    const UnitRepository& units_;
    std::string lang_;
};

// Validate stage: make sure the item's validation unit exists (generating it
// on first use when a generator is present), then run the test checker on it.
class ToolValidator : public IValidator {
public:
    ToolValidator(const ConfinedFileStore& store,
                  const SandboxedProcessRunner& runner,
                  ToolCommand test_cmd,
                  const UnitRepository& units,
                  ITestGenerator* generator = nullptr,
                  JsonlLogger* log = nullptr);

    TestOutcome validate(const std::string& item_id,
                         const std::string& content,
                         const std::string& findings) override;

private:
    void generate_unit(const std::string& item_id,
                       const std::string& test_path,
                       const std::string& content,
                       const std::string& findings);

    const ConfinedFileStore& store_;
    const SandboxedProcessRunner& runner_;
    ToolCommand test_cmd_;
    const UnitRepository& units_;
    ITestGenerator* generator_;
    JsonlLogger* log_;
};

} // namespace reviser

#pragma once

// Revision loop: the per-item Analyze -> Mutate -> Validate state machine.
//
//   iteration = 1, status = IN_PROGRESS
//   findings  = Analyze(item)
//   loop:
//     content = Mutate(item, content, findings, validation_summary); commit
//     outcome = Validate(item, content, findings)
//     collected == 0 or failing -> RETRY (iteration < ceiling) | MAX_ITERATIONS
//     all_passed               -> SUCCESS
//     RETRY                    -> iteration += 1, back to Mutate
//
// The iteration counter only moves on the RETRY transition, so an item gets
// at most `max_iterations` Mutate/Validate rounds. A stage that throws never
// stops the loop: its error is recorded in-band (findings marker, retained
// content, or validation summary) and the next transition happens as usual.
// Cancellation is checked before every stage and pins status to ABANDONED.

#include "file_store.h"
#include "log.h"
#include "types.h"

#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace reviser {

enum class RevisionStatus {
    IN_PROGRESS,
    SUCCESS,
    RETRY,
    MAX_ITERATIONS,
    ABANDONED,
};

const char* revision_status_name(RevisionStatus s);

struct RevisionState {
    std::string item_id;          // canonical path, fixed at creation
    std::string original_content; // fixed at creation
    std::string findings;
    std::string current_content;
    std::optional<std::string> validation_summary;
    int iteration{1};
    RevisionStatus status{RevisionStatus::IN_PROGRESS};
    std::string last_error;       // stage fault of the current round, empty if none

    RevisionState(std::string id, std::string original)
        : item_id(std::move(id)), original_content(std::move(original)) {
        current_content = original_content;
    }
};

// Thrown by collaborators that could not produce a stage result.
class CollaboratorFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IAnalyzer {
public:
    virtual ~IAnalyzer() = default;
    virtual std::string analyze(const std::string& item_id, const std::string& content) = 0;
};

class IMutator {
public:
    virtual ~IMutator() = default;
    virtual std::string mutate(const std::string& item_id,
                               const std::string& content,
                               const std::string& findings,
                               const std::optional<std::string>& prior_validation_summary) = 0;
};

class IValidator {
public:
    virtual ~IValidator() = default;
    virtual TestOutcome validate(const std::string& item_id,
                                 const std::string& content,
                                 const std::string& findings) = 0;
};

// Writes a validation unit for an item that has none yet.
class ITestGenerator {
public:
    virtual ~ITestGenerator() = default;
    virtual std::string generate(const std::string& item_id,
                                 const std::string& content,
                                 const std::string& findings) = 0;
};

struct LoopOptions {
    int max_iterations{10};
    int stage_delay_ms{0}; // pause after each collaborator call
};

class RevisionLoop {
public:
    RevisionLoop(IAnalyzer& analyzer,
                 IMutator& mutator,
                 IValidator& validator,
                 const ConfinedFileStore& store,
                 LoopOptions opts = {},
                 JsonlLogger* log = nullptr);

    // Drives one item to a terminal status. `cancel` is polled at stage
    // boundaries; it may be null.
    RevisionState run(const std::string& item_id,
                      const std::string& original_content,
                      const std::atomic<bool>* cancel = nullptr);

private:
    void analyze_stage(RevisionState& st);
    void mutate_stage(RevisionState& st);
    void validate_stage(RevisionState& st);
    RevisionStatus retry_or_stop(const RevisionState& st) const;
    void pause() const;
    void record(const RevisionState& st, const char* agent, ActionType action,
                bool success, const std::string& payload_json) const;

    IAnalyzer& analyzer_;
    IMutator& mutator_;
    IValidator& validator_;
    const ConfinedFileStore& store_;
    LoopOptions opts_;
    JsonlLogger* log_;
};

} // namespace reviser

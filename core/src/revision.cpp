#include "reviser/revision.h"
#include "reviser/json_mini.h"
#include "reviser/test_report.h"

#include <json-c/json.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>

namespace reviser {

const char* revision_status_name(RevisionStatus s) {
    switch (s) {
        case RevisionStatus::IN_PROGRESS:    return "in_progress";
        case RevisionStatus::SUCCESS:        return "success";
        case RevisionStatus::RETRY:          return "retry";
        case RevisionStatus::MAX_ITERATIONS: return "max_iterations";
        case RevisionStatus::ABANDONED:      return "abandoned";
    }
    return "unknown";
}

namespace {

// Small payload builder; keeps the stage code free of json-c refcounting.
class Payload {
public:
    Payload() : obj_(json_object_new_object()) {}
    ~Payload() { json_object_put(obj_); }
    Payload(const Payload&) = delete;
    Payload& operator=(const Payload&) = delete;

    Payload& str(const char* k, const std::string& v) {
        json_mini::add_string(obj_, k, v);
        return *this;
    }
    Payload& num(const char* k, int64_t v) {
        json_object_object_add(obj_, k, json_object_new_int64(v));
        return *this;
    }
    Payload& flag(const char* k, bool v) {
        json_object_object_add(obj_, k, json_object_new_boolean(v ? 1 : 0));
        return *this;
    }
    std::string dump() const { return json_mini::to_string_plain(obj_); }

private:
    json_object* obj_;
};

} // namespace

RevisionLoop::RevisionLoop(IAnalyzer& analyzer,
                           IMutator& mutator,
                           IValidator& validator,
                           const ConfinedFileStore& store,
                           LoopOptions opts,
                           JsonlLogger* log)
    : analyzer_(analyzer),
      mutator_(mutator),
      validator_(validator),
      store_(store),
      opts_(opts),
      log_(log) {
    if (opts_.max_iterations < 1) opts_.max_iterations = 1;
    if (opts_.stage_delay_ms < 0) opts_.stage_delay_ms = 0;
}

RevisionState RevisionLoop::run(const std::string& item_id,
                                const std::string& original_content,
                                const std::atomic<bool>* cancel) {
    RevisionState st(item_id, original_content);
    auto cancelled = [cancel]() { return cancel && cancel->load(); };

    if (cancelled()) {
        st.status = RevisionStatus::ABANDONED;
        return st;
    }
    analyze_stage(st);

    for (;;) {
        if (cancelled()) {
            st.status = RevisionStatus::ABANDONED;
            break;
        }
        mutate_stage(st);

        if (cancelled()) {
            st.status = RevisionStatus::ABANDONED;
            break;
        }
        validate_stage(st);

        if (st.status != RevisionStatus::RETRY) break;
        st.iteration += 1;
        st.last_error.clear();
    }

    std::cerr << "[revision] " << st.item_id << ": " << revision_status_name(st.status)
              << " after " << st.iteration << " iteration(s)\n";
    return st;
}

void RevisionLoop::analyze_stage(RevisionState& st) {
    try {
        st.findings = analyzer_.analyze(st.item_id, st.current_content);
        record(st, "Auditor", ActionType::ANALYSIS, true,
               Payload().num("findings_bytes", (int64_t)st.findings.size()).dump());
    } catch (const std::exception& e) {
        st.findings = std::string("ERROR: Analysis failed - ") + e.what();
        st.last_error = st.findings;
        std::cerr << "[revision] " << st.item_id << ": analyze failed: " << e.what() << "\n";
        record(st, "Auditor", ActionType::ANALYSIS, false, Payload().str("error", e.what()).dump());
    }
    st.status = RevisionStatus::IN_PROGRESS;
    pause();
}

void RevisionLoop::mutate_stage(RevisionState& st) {
    std::string fixed;
    std::string err;
    try {
        fixed = mutator_.mutate(st.item_id, st.current_content, st.findings, st.validation_summary);
        if (fixed.empty()) err = "mutator returned empty content";
    } catch (const std::exception& e) {
        err = e.what();
    }

    if (err.empty()) {
        WriteOutcome w = store_.write(st.item_id, fixed);
        if (!w.ok()) err = "commit failed: " + w.error;
    }

    if (err.empty()) {
        st.current_content = std::move(fixed);
        record(st, "Fixer", ActionType::FIX, true,
               Payload().num("content_bytes", (int64_t)st.current_content.size()).dump());
    } else {
        // prior content stays in place, on disk and in the state
        st.last_error = "Mutate failed: " + err;
        std::cerr << "[revision] " << st.item_id << ": mutate failed: " << err << "\n";
        record(st, "Fixer", ActionType::FIX, false, Payload().str("error", err).dump());
    }
    st.status = RevisionStatus::IN_PROGRESS;
    pause();
}

void RevisionLoop::validate_stage(RevisionState& st) {
    try {
        TestOutcome t = validator_.validate(st.item_id, st.current_content, st.findings);
        st.validation_summary = summarize_test_outcome(t);

        if (t.collected == 0) {
            st.status = retry_or_stop(st);
        } else if (t.all_passed) {
            st.status = RevisionStatus::SUCCESS;
        } else {
            st.status = retry_or_stop(st);
        }

        record(st, "Judge", ActionType::DEBUG, t.all_passed,
               Payload()
                   .num("collected", t.collected)
                   .num("passed", t.passed_count)
                   .num("failed", t.failed_count)
                   .flag("collection_error", t.collection_error)
                   .str("summary", *st.validation_summary)
                   .dump());
    } catch (const std::exception& e) {
        st.validation_summary = std::string("Test execution error: ") + e.what();
        st.last_error = *st.validation_summary;
        st.status = retry_or_stop(st);
        std::cerr << "[revision] " << st.item_id << ": validate failed: " << e.what() << "\n";
        record(st, "Judge", ActionType::DEBUG, false, Payload().str("error", e.what()).dump());
    }
    pause();
}

RevisionStatus RevisionLoop::retry_or_stop(const RevisionState& st) const {
    return st.iteration < opts_.max_iterations ? RevisionStatus::RETRY : RevisionStatus::MAX_ITERATIONS;
}

void RevisionLoop::pause() const {
    if (opts_.stage_delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(opts_.stage_delay_ms));
    }
}

void RevisionLoop::record(const RevisionState& st, const char* agent, ActionType action,
                          bool success, const std::string& payload_json) const {
    if (!log_) return;
    log_->event(st.item_id, st.iteration, agent, action, success, payload_json);
}

} // namespace reviser

#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace reviser {

// Pipeline step kinds recorded in the experiment log.
enum class ActionType {
    ANALYSIS,   // analyze stage
    FIX,        // mutate stage
    GENERATION, // validation unit generated
    DEBUG,      // validation unit executed
};

const char* action_name(ActionType a);

struct RunHeader {
    std::string log_version{"1"};
    std::string run_id;
};

// Experiment log: one canonical JSON object per line (sorted keys).
// Safe to share between batch workers.
class JsonlLogger {
public:
    JsonlLogger(const RunHeader& hdr, const std::string& path);

    // `payload_json` should be a JSON object; anything unparseable is
    // stored as a string.
    void event(const std::string& item,
               int iteration,
               const std::string& agent,
               ActionType action,
               bool success,
               const std::string& payload_json);

    const std::string& path() const { return path_; }
    bool ok() const { return static_cast<bool>(out_); }

private:
    RunHeader hdr_;
    std::string path_;
    std::mutex mu_;
    std::ofstream out_;
    uint64_t seq_{0};
};

} // namespace reviser

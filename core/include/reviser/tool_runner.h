#pragma once
#include "path_guard.h"
#include "types.h"

#include <string>
#include <utility>
#include <vector>

namespace reviser {

// Runs external checker tools against a confined target.
//
// Contract of run():
//   - working_target outside the sandbox  -> executed=false, nothing spawned
//   - working_target missing on disk      -> executed=false, "target not found"
//   - timeout                             -> executed=false, "timed out",
//                                            partial output + timeout marker
//   - binary missing / OS fault           -> executed=false, OS error text
//   - tool ran and exited non-zero        -> executed=true (verdict is in raw_output)
// The child runs with the target's directory as its working directory.
class SandboxedProcessRunner {
public:
    explicit SandboxedProcessRunner(PathGuard guard, size_t output_max_bytes = 1024 * 1024)
        : guard_(std::move(guard)), output_max_bytes_(output_max_bytes) {}

    ToolInvocationResult run(const std::string& executable,
                             const std::vector<std::string>& args,
                             const std::string& working_target,
                             int timeout_seconds) const;

    const PathGuard& guard() const { return guard_; }

private:
    PathGuard guard_;
    size_t output_max_bytes_;
};

// Appended to captured output when a tool is killed for exceeding its timeout.
extern const char* const kTimeoutMarker;

} // namespace reviser

#pragma once
#include "checkers.h"

#include <cstddef>
#include <string>
#include <vector>

namespace reviser {

enum class Profile { DEV, PROD };

// Upper bound accepted for every *_TIMEOUT_SEC setting (one day).
constexpr int kMaxTimeoutSec = 24 * 60 * 60;

// Detect profile from REVISER_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

struct ReviserConfig {
    Profile profile{Profile::DEV};
    std::string sandbox_root{"./sandbox"};
    int max_iterations{10};
    int workers{1};

    ToolCommand lint{default_lint_command()};
    ToolCommand test{default_test_command()};

    // Stage collaborators (argv, no shell). Empty = not configured.
    std::vector<std::string> analyze_cmd;
    std::vector<std::string> mutate_cmd;
    std::vector<std::string> testgen_cmd;
    int collab_timeout_sec{120};

    int stage_delay_ms{0};
    size_t output_max_bytes{1024 * 1024};
    std::string log_path; // empty: <sandbox>/../logs/experiment_data.jsonl
};

// Profile defaults only, no environment.
// DEV: generous collaborator timeout, no inter-stage delay
// PROD: tighter collaborator timeout, 2 s between stages (rate limiting)
ReviserConfig default_config(Profile p);

// Profile defaults, then REVISER_* overrides. This is the only place the
// environment is read; the result is passed down explicitly.
// Malformed numbers keep the default.
ReviserConfig load_config(Profile p);

// Problems that make the config unusable; empty when fine.
// `for_run` additionally requires the analyze and mutate collaborators;
// test generation is optional (existing validation units are used as is).
std::vector<std::string> validate_config(const ReviserConfig& cfg, bool for_run);

std::string resolve_log_path(const ReviserConfig& cfg);

} // namespace reviser

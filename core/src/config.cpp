#include "reviser/config.h"
#include "reviser/proc.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace reviser {

Profile detect_profile() {
    const char* env = std::getenv("REVISER_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

ReviserConfig default_config(Profile p) {
    ReviserConfig c;
    c.profile = p;
    switch (p) {
        case Profile::DEV:
            c.collab_timeout_sec = 120;
            c.stage_delay_ms = 0;
            break;
        case Profile::PROD:
            c.collab_timeout_sec = 60;
            c.stage_delay_ms = 2000;
            break;
    }
    return c;
}

// Whole value must be a number; anything else keeps `defv`.
static long long getenv_ll(const char* k, long long defv) {
    const char* e = std::getenv(k);
    if (!e || !*e) return defv;
    try {
        size_t pos = 0;
        long long v = std::stoll(e, &pos);
        if (pos != std::string(e).size()) {
            std::cerr << "[config] ignoring malformed " << k << "=" << e << "\n";
            return defv;
        }
        return v;
    } catch (const std::exception&) {
        std::cerr << "[config] ignoring malformed " << k << "=" << e << "\n";
        return defv;
    }
}

static int getenv_int(const char* k, int defv) {
    long long v = getenv_ll(k, defv);
    if (v < -2147483647LL || v > 2147483647LL) return defv;
    return (int)v;
}

static void getenv_argv(const char* k, std::vector<std::string>* out) {
    const char* e = std::getenv(k);
    if (!e) return;
    *out = split_argv_quoted(e);
    if (out->empty() && *e) std::cerr << "[config] cannot parse " << k << " (unbalanced quotes?)\n";
}

ReviserConfig load_config(Profile p) {
    ReviserConfig c = default_config(p);

    if (const char* v = std::getenv("REVISER_SANDBOX_ROOT")) {
        if (*v) c.sandbox_root = v;
    }
    c.max_iterations = getenv_int("REVISER_MAX_ITERATIONS", c.max_iterations);
    c.workers = std::clamp(getenv_int("REVISER_WORKERS", c.workers), 1, 64);

    getenv_argv("REVISER_LINT_CMD", &c.lint.argv);
    c.lint.timeout_sec = getenv_int("REVISER_LINT_TIMEOUT_SEC", c.lint.timeout_sec);
    getenv_argv("REVISER_TEST_CMD", &c.test.argv);
    c.test.timeout_sec = getenv_int("REVISER_TEST_TIMEOUT_SEC", c.test.timeout_sec);

    getenv_argv("REVISER_ANALYZE_CMD", &c.analyze_cmd);
    getenv_argv("REVISER_MUTATE_CMD", &c.mutate_cmd);
    getenv_argv("REVISER_TESTGEN_CMD", &c.testgen_cmd);
    c.collab_timeout_sec = getenv_int("REVISER_COLLAB_TIMEOUT_SEC", c.collab_timeout_sec);

    c.stage_delay_ms = getenv_int("REVISER_STAGE_DELAY_MS", c.stage_delay_ms);
    long long cap = getenv_ll("REVISER_OUTPUT_MAX_BYTES", (long long)c.output_max_bytes);
    if (cap > 0) c.output_max_bytes = (size_t)cap;

    if (const char* v = std::getenv("REVISER_LOG_PATH")) c.log_path = v;
    return c;
}

static void check_timeout(int sec, const char* name, std::vector<std::string>* errs) {
    if (sec < 1 || sec > kMaxTimeoutSec) {
        errs->push_back(std::string(name) + " must be in [1, " + std::to_string(kMaxTimeoutSec) + "]");
    }
}

std::vector<std::string> validate_config(const ReviserConfig& cfg, bool for_run) {
    std::vector<std::string> errs;
    if (cfg.sandbox_root.empty()) errs.push_back("sandbox root is empty");
    if (cfg.max_iterations < 1) errs.push_back("REVISER_MAX_ITERATIONS must be >= 1");
    if (cfg.lint.argv.empty()) errs.push_back("REVISER_LINT_CMD is empty");
    if (cfg.test.argv.empty()) errs.push_back("REVISER_TEST_CMD is empty");
    check_timeout(cfg.lint.timeout_sec, "REVISER_LINT_TIMEOUT_SEC", &errs);
    check_timeout(cfg.test.timeout_sec, "REVISER_TEST_TIMEOUT_SEC", &errs);
    if (cfg.stage_delay_ms < 0) errs.push_back("REVISER_STAGE_DELAY_MS must be >= 0");
    if (for_run) {
        if (cfg.analyze_cmd.empty()) errs.push_back("REVISER_ANALYZE_CMD is not set");
        if (cfg.mutate_cmd.empty()) errs.push_back("REVISER_MUTATE_CMD is not set");
        check_timeout(cfg.collab_timeout_sec, "REVISER_COLLAB_TIMEOUT_SEC", &errs);
    }
    return errs;
}

std::string resolve_log_path(const ReviserConfig& cfg) {
    if (!cfg.log_path.empty()) return cfg.log_path;
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path root = fs::absolute(cfg.sandbox_root, ec);
    if (ec) root = cfg.sandbox_root;
    root = root.lexically_normal();
    if (root.filename().empty()) root = root.parent_path();
    return (root.parent_path() / "logs" / "experiment_data.jsonl").string();
}

} // namespace reviser

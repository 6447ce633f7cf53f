#include "reviser/path_guard.h"

namespace reviser {

namespace fs = std::filesystem;

// Absolute, symlink-resolved (where it exists), lexically normal, without a
// trailing separator. Empty path on failure.
static fs::path normalize_abs(const fs::path& p, std::error_code& ec) {
    fs::path abs = p.is_absolute() ? p : fs::absolute(p, ec);
    if (ec) return {};
    fs::path canon = fs::weakly_canonical(abs, ec);
    if (ec) return {};
    canon = canon.lexically_normal();
    if (canon.has_relative_path() && canon.filename().empty()) canon = canon.parent_path();
    return canon;
}

static bool same_fs_root(const fs::path& a, const fs::path& b) {
    return a.root_name() == b.root_name() && a.root_directory() == b.root_directory();
}

// Segment-wise prefix test; both inputs are normalized.
static bool is_within(const fs::path& p, const fs::path& root) {
    auto pit = p.begin();
    for (auto rit = root.begin(); rit != root.end(); ++rit, ++pit) {
        if (pit == p.end()) return false;
        if (*rit != *pit) return false;
    }
    return true;
}

PathGuard::PathGuard(const fs::path& root) {
    std::error_code ec;
    root_ = normalize_abs(root, ec);
    if (ec || root_.empty()) {
        // root may live on a path weakly_canonical cannot stat; keep the lexical form
        std::error_code ec2;
        root_ = fs::absolute(root, ec2).lexically_normal();
        if (root_.has_relative_path() && root_.filename().empty()) root_ = root_.parent_path();
    }
}

bool PathGuard::check(const fs::path& p, fs::path* resolved, std::string* error) const {
    if (p.empty()) {
        if (error) *error = "empty path";
        return false;
    }
    std::error_code ec;
    fs::path canon = normalize_abs(p, ec);
    if (ec || canon.empty()) {
        if (error) *error = "cannot resolve path '" + p.string() + "': " + ec.message();
        return false;
    }
    if (!same_fs_root(canon, root_)) {
        if (error) *error = "path '" + p.string() + "' is on a different filesystem root than sandbox " + root_.string();
        return false;
    }
    if (!is_within(canon, root_)) {
        if (error) *error = "access to '" + p.string() + "' denied (outside sandbox " + root_.string() + ")";
        return false;
    }
    if (resolved) *resolved = canon;
    return true;
}

fs::path PathGuard::validate(const fs::path& p) const {
    fs::path out;
    std::string err;
    if (!check(p, &out, &err)) throw SandboxViolation(err);
    return out;
}

} // namespace reviser

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace reviser {

// Raised when a path resolves outside the sandbox root.
class SandboxViolation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Path confinement: every file the pipeline touches must resolve to the
// sandbox root or a descendant of it. Containment is decided per path
// segment on weakly-canonical absolute forms, so "/sandbox-evil" is never
// inside "/sandbox" and symlinked parents are resolved before comparing.
class PathGuard {
public:
    explicit PathGuard(const std::filesystem::path& root);

    // Returns the canonical absolute path, or throws SandboxViolation.
    std::filesystem::path validate(const std::filesystem::path& p) const;

    // Non-throwing form. On success writes the canonical path to `resolved`;
    // on failure writes the reason to `error`.
    bool check(const std::filesystem::path& p,
               std::filesystem::path* resolved,
               std::string* error) const;

    bool contains(const std::filesystem::path& p) const { return check(p, nullptr, nullptr); }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace reviser

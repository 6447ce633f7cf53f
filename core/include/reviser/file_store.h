#pragma once
#include "path_guard.h"

#include <filesystem>
#include <string>
#include <utility>

namespace reviser {

struct WriteOutcome {
    enum class Kind { OK, SANDBOX_VIOLATION, IO_ERROR };
    Kind kind{Kind::OK};
    std::string error;

    bool ok() const { return kind == Kind::OK; }
};

// Text I/O confined to the sandbox root.
//
// read() never fails loudly: any problem (outside sandbox, missing file,
// permission) yields "" and a diagnostic on stderr. Callers treat empty
// content as "nothing to process".
//
// write() is all-or-nothing: content goes to a temp sibling, is fsynced and
// renamed over the target. Missing parent directories are created.
class ConfinedFileStore {
public:
    explicit ConfinedFileStore(PathGuard guard) : guard_(std::move(guard)) {}

    std::string read(const std::filesystem::path& p) const;
    WriteOutcome write(const std::filesystem::path& p, const std::string& content) const;

    const PathGuard& guard() const { return guard_; }

private:
    PathGuard guard_;
};

} // namespace reviser

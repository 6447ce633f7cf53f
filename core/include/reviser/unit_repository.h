#pragma once
#include "path_guard.h"

#include <filesystem>
#include <string>
#include <vector>

namespace reviser {

struct UnitFilter {
    std::string extension{".py"};
    // Directory names pruned during traversal (never descended into).
    std::vector<std::string> excluded_dirs{".git", ".venv", "venv", "__pycache__", "node_modules", ".pytest_cache"};
    // Files named "<prefix>..." are validation units, everything else is a source unit.
    std::string validation_prefix{"test_"};
};

// Discovers revision units (one file per unit) below a root.
class UnitRepository {
public:
    UnitRepository(PathGuard guard, UnitFilter filter = {});

    // All matching files, absolute and sorted. A missing, unreadable or
    // out-of-sandbox root gives an empty list.
    std::vector<std::filesystem::path> list(const std::filesystem::path& root) const;

    // list() minus validation units.
    std::vector<std::filesystem::path> list_sources(const std::filesystem::path& root) const;

    bool is_validation_unit(const std::filesystem::path& p) const;

    // dir/name.ext -> dir/<prefix>name.ext
    std::filesystem::path validation_unit_for(const std::filesystem::path& source) const;

    const UnitFilter& filter() const { return filter_; }

private:
    PathGuard guard_;
    UnitFilter filter_;
};

} // namespace reviser

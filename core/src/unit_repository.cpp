#include "reviser/unit_repository.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace reviser {

namespace fs = std::filesystem;

UnitRepository::UnitRepository(PathGuard guard, UnitFilter filter)
    : guard_(std::move(guard)), filter_(std::move(filter)) {}

std::vector<fs::path> UnitRepository::list(const fs::path& root) const {
    std::vector<fs::path> out;

    fs::path safe_root;
    std::string err;
    if (!guard_.check(root, &safe_root, &err)) {
        std::cerr << "[units] cannot list '" << root.string() << "': " << err << "\n";
        return out;
    }

    std::error_code ec;
    if (!fs::is_directory(safe_root, ec)) return out;

    fs::recursive_directory_iterator it(safe_root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[units] cannot list '" << root.string() << "': " << ec.message() << "\n";
        return out;
    }

    const auto& excluded = filter_.excluded_dirs;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            // unreadable entry: stop rather than loop on the same error
            std::cerr << "[units] traversal stopped under '" << root.string() << "': " << ec.message() << "\n";
            break;
        }
        const fs::directory_entry& e = *it;
        std::error_code sec;
        if (e.is_directory(sec)) {
            std::string name = e.path().filename().string();
            if (std::find(excluded.begin(), excluded.end(), name) != excluded.end()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!e.is_regular_file(sec)) continue;
        if (e.path().extension() != filter_.extension) continue;
        out.push_back(e.path());
    }

    std::sort(out.begin(), out.end());
    return out;
}

std::vector<fs::path> UnitRepository::list_sources(const fs::path& root) const {
    auto all = list(root);
    all.erase(std::remove_if(all.begin(), all.end(),
                             [this](const fs::path& p) { return is_validation_unit(p); }),
              all.end());
    return all;
}

bool UnitRepository::is_validation_unit(const fs::path& p) const {
    return p.filename().string().rfind(filter_.validation_prefix, 0) == 0;
}

fs::path UnitRepository::validation_unit_for(const fs::path& source) const {
    return source.parent_path() / (filter_.validation_prefix + source.stem().string() + filter_.extension);
}

} // namespace reviser

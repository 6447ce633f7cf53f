#pragma once
#include "file_store.h"
#include "revision.h"
#include "unit_repository.h"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace reviser {

enum class ItemStatus { SUCCESS, MAX_ITERATIONS, ABANDONED, ERROR, SKIPPED };

const char* item_status_name(ItemStatus s);

struct ItemReport {
    std::string item_id;
    ItemStatus status{ItemStatus::ABANDONED};
    int iterations{0};  // 0 when the loop never ran
    std::string detail; // skip reason, escaped fault, or the last stage error
};

struct BatchReport {
    std::vector<ItemReport> items; // discovery order

    size_t count(ItemStatus s) const;
};

// Runs the revision loop over every source unit below a root.
//
// Items are independent: an unreadable or empty unit is SKIPPED, a fault
// escaping the loop marks only that item ERROR. With workers > 1 items are
// claimed from a shared index; the loop and its collaborators must then be
// safe to call concurrently for distinct items. Items still unclaimed when
// `cancel` is raised are reported ABANDONED.
class BatchRunner {
public:
    BatchRunner(const UnitRepository& units,
                const ConfinedFileStore& store,
                RevisionLoop& loop,
                int workers = 1);

    BatchReport run(const std::filesystem::path& root, const std::atomic<bool>* cancel = nullptr);

private:
    ItemReport process(const std::string& item_id, const std::atomic<bool>* cancel);

    const UnitRepository& units_;
    const ConfinedFileStore& store_;
    RevisionLoop& loop_;
    int workers_;
};

} // namespace reviser

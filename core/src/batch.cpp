#include "reviser/batch.h"

#include <algorithm>
#include <iostream>
#include <thread>

namespace reviser {

const char* item_status_name(ItemStatus s) {
    switch (s) {
        case ItemStatus::SUCCESS:        return "success";
        case ItemStatus::MAX_ITERATIONS: return "max_iterations";
        case ItemStatus::ABANDONED:      return "abandoned";
        case ItemStatus::ERROR:          return "error";
        case ItemStatus::SKIPPED:        return "skipped";
    }
    return "unknown";
}

size_t BatchReport::count(ItemStatus s) const {
    return (size_t)std::count_if(items.begin(), items.end(),
                                 [s](const ItemReport& r) { return r.status == s; });
}

BatchRunner::BatchRunner(const UnitRepository& units,
                         const ConfinedFileStore& store,
                         RevisionLoop& loop,
                         int workers)
    : units_(units), store_(store), loop_(loop), workers_(std::max(1, workers)) {}

BatchReport BatchRunner::run(const std::filesystem::path& root, const std::atomic<bool>* cancel) {
    BatchReport rep;
    const auto files = units_.list_sources(root);
    rep.items.resize(files.size());
    for (size_t i = 0; i < files.size(); i++) {
        rep.items[i].item_id = files[i].string();
        rep.items[i].detail = "not started";
    }
    std::cerr << "[batch] " << files.size() << " item(s) under " << root.string() << "\n";
    if (files.empty()) return rep;

    std::atomic<size_t> next{0};
    auto worker_fn = [&]() {
        for (;;) {
            if (cancel && cancel->load()) return;
            size_t i = next.fetch_add(1);
            if (i >= rep.items.size()) return;
            rep.items[i] = process(rep.items[i].item_id, cancel);
            std::cerr << "[batch] " << (i + 1) << "/" << rep.items.size() << " "
                      << rep.items[i].item_id << ": " << item_status_name(rep.items[i].status) << "\n";
        }
    };

    const int n = std::min<int>(workers_, (int)rep.items.size());
    if (n <= 1) {
        worker_fn();
        return rep;
    }

    std::vector<std::thread> th;
    th.reserve((size_t)n);
    for (int i = 0; i < n; i++) th.emplace_back(worker_fn);
    for (auto& t : th) t.join();
    return rep;
}

ItemReport BatchRunner::process(const std::string& item_id, const std::atomic<bool>* cancel) {
    ItemReport r;
    r.item_id = item_id;

    const std::string content = store_.read(item_id);
    if (content.empty()) {
        r.status = ItemStatus::SKIPPED;
        r.detail = "empty or unreadable";
        return r;
    }

    try {
        RevisionState st = loop_.run(item_id, content, cancel);
        r.iterations = st.iteration;
        r.detail = st.last_error;
        switch (st.status) {
            case RevisionStatus::SUCCESS:        r.status = ItemStatus::SUCCESS; break;
            case RevisionStatus::MAX_ITERATIONS: r.status = ItemStatus::MAX_ITERATIONS; break;
            case RevisionStatus::ABANDONED:      r.status = ItemStatus::ABANDONED; break;
            default:
                r.status = ItemStatus::ERROR;
                r.detail = std::string("loop stopped in state ") + revision_status_name(st.status);
                break;
        }
    } catch (const std::exception& e) {
        r.status = ItemStatus::ERROR;
        r.detail = e.what();
        std::cerr << "[batch] " << item_id << ": " << e.what() << "\n";
    } catch (...) {
        // a worker thread must not die with the batch half done
        r.status = ItemStatus::ERROR;
        r.detail = "non-standard exception";
        std::cerr << "[batch] " << item_id << ": non-standard exception\n";
    }
    return r;
}

} // namespace reviser

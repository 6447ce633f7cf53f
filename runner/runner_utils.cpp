#include "runner_utils.h"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace reviser {

std::string gen_run_id() {
    uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
    uint64_t r = 0;
    try {
        std::random_device rd;
        r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
    } catch (const std::exception&) {
        r = 0x9e3779b97f4a7c15ULL; // no entropy source: the clock still varies
    }

    std::mt19937_64 rng{t ^ r};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << a << b;
    return oss.str();
}

bool parse_int_arg(const std::string& s, int lo, int hi, int* out) {
    if (s.empty()) return false;
    try {
        size_t pos = 0;
        long v = std::stol(s, &pos);
        if (pos != s.size() || v < lo || v > hi) return false;
        *out = (int)v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool report_config_errors(const ReviserConfig& cfg, bool for_run) {
    auto errs = validate_config(cfg, for_run);
    for (const auto& e : errs) std::cerr << "[config] " << e << "\n";
    return !errs.empty();
}

void print_batch_report(std::ostream& out, const BatchReport& rep) {
    out << std::left << std::setw(16) << "STATUS" << std::setw(6) << "ITER" << "ITEM\n";
    for (const auto& it : rep.items) {
        out << std::left << std::setw(16) << item_status_name(it.status)
            << std::setw(6) << it.iterations << it.item_id;
        if (!it.detail.empty() && it.status != ItemStatus::SUCCESS) out << "  (" << it.detail << ")";
        out << "\n";
    }
    out << "\nsummary: total=" << rep.items.size()
        << " success=" << rep.count(ItemStatus::SUCCESS)
        << " max_iterations=" << rep.count(ItemStatus::MAX_ITERATIONS)
        << " error=" << rep.count(ItemStatus::ERROR)
        << " skipped=" << rep.count(ItemStatus::SKIPPED)
        << " abandoned=" << rep.count(ItemStatus::ABANDONED) << "\n";
}

} // namespace reviser

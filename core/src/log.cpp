#include "reviser/log.h"
#include "reviser/json_mini.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace reviser {

const char* action_name(ActionType a) {
    switch (a) {
        case ActionType::ANALYSIS:   return "ANALYSIS";
        case ActionType::FIX:        return "FIX";
        case ActionType::GENERATION: return "GENERATION";
        case ActionType::DEBUG:      return "DEBUG";
    }
    return "UNKNOWN";
}

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Recursively serialize JSON with sorted keys so lines diff cleanly.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string(ks);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

static std::ofstream open_log(const std::string& path) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    return std::ofstream(path, std::ios::out | std::ios::app);
}

JsonlLogger::JsonlLogger(const RunHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(open_log(path)) {}

void JsonlLogger::event(const std::string& item,
                        int iteration,
                        const std::string& agent,
                        ActionType action,
                        bool success,
                        const std::string& payload_json) {
    std::string ts = iso_now();

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "action", json_object_new_string(action_name(action)));
    json_object_object_add(rec, "agent", json_object_new_string(agent.c_str()));
    json_mini::add_string(rec, "item", item);
    json_object_object_add(rec, "iteration", json_object_new_int(iteration));
    json_object_object_add(rec, "log_version", json_object_new_string(hdr_.log_version.c_str()));
    json_object_object_add(rec, "run_id", json_object_new_string(hdr_.run_id.c_str()));
    json_object_object_add(rec, "status", json_object_new_string(success ? "SUCCESS" : "FAILURE"));
    json_object_object_add(rec, "ts", json_object_new_string(ts.c_str()));

    json_mini::Doc payload = json_mini::parse(payload_json);
    if (payload && json_object_is_type(payload.root, json_type_object)) {
        json_object_object_add(rec, "payload", json_object_get(payload.root));
    } else {
        json_mini::add_string(rec, "payload", payload_json);
    }

    std::lock_guard<std::mutex> lk(mu_);
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)++seq_));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    out_ << line.str() << "\n";
    out_.flush();
}

} // namespace reviser

#include "reviser/lint_report.h"
#include "reviser/json_mini.h"

#include <cstdlib>
#include <sstream>

namespace reviser {

static const char* kScoreMarker = "Your code has been rated at";

static std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
    size_t i=0;
    while (i<s.size() && (s[i]=='\n' || s[i]=='\r' || s[i]==' ' || s[i]=='\t')) i++;
    if (i) s.erase(0,i);
    return s;
}

static Violation violation_from_json(json_object* o) {
    Violation v;
    v.message_id = json_mini::member_string(o, "message-id").value_or("");
    v.symbol = json_mini::member_string(o, "symbol").value_or("");
    v.message = json_mini::member_string(o, "message").value_or("");
    v.type = json_mini::member_string(o, "type").value_or("");
    v.path = json_mini::member_string(o, "path").value_or("");
    v.line = (int)json_mini::member_int(o, "line").value_or(0);
    v.column = (int)json_mini::member_int(o, "column").value_or(0);
    return v;
}

std::vector<Violation> parse_violations(const std::string& raw, bool* parsed) {
    std::vector<Violation> out;
    if (parsed) *parsed = false;

    size_t line_start = 0;
    while (line_start < raw.size()) {
        size_t i = line_start;
        while (i < raw.size() && (raw[i] == ' ' || raw[i] == '\t')) i++;
        if (i < raw.size() && raw[i] == '[') {
            json_mini::Doc d = json_mini::parse_prefix(raw, i);
            if (d && json_object_is_type(d.root, json_type_array)) {
                const size_t n = json_object_array_length(d.root);
                out.reserve(n);
                for (size_t k = 0; k < n; k++) {
                    json_object* el = json_object_array_get_idx(d.root, k);
                    if (el && json_object_is_type(el, json_type_object)) {
                        out.push_back(violation_from_json(el));
                    }
                }
                if (parsed) *parsed = true;
                return out;
            }
        }
        size_t nl = raw.find('\n', line_start);
        if (nl == std::string::npos) break;
        line_start = nl + 1;
    }
    return out;
}

double parse_quality_score(const std::string& raw) {
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        size_t pos = line.find(kScoreMarker);
        if (pos == std::string::npos) continue;

        std::string rest = line.substr(pos + std::char_traits<char>::length(kScoreMarker));
        size_t slash = rest.find('/');
        if (slash == std::string::npos) return 0.0;
        std::string num = trim_ws(rest.substr(0, slash));
        if (num.empty()) return 0.0;

        char* end = nullptr;
        double v = std::strtod(num.c_str(), &end);
        if (end == num.c_str() || *end != '\0') return 0.0;
        return v;
    }
    return 0.0;
}

AnalysisOutcome parse_analysis_output(const std::string& raw) {
    AnalysisOutcome a;
    a.violations = parse_violations(raw);
    a.score = parse_quality_score(raw);
    a.raw_output = raw;
    return a;
}

AnalysisOutcome analysis_from_invocation(const ToolInvocationResult& inv) {
    AnalysisOutcome a = parse_analysis_output(inv.raw_output);
    if (!inv.executed) a.execution_error = inv.execution_error;
    return a;
}

} // namespace reviser

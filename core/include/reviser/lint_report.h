#pragma once
#include "types.h"

#include <string>
#include <vector>

namespace reviser {

// Static-analysis report parsing (pylint --output-format=json --score=yes).
//
// The tool prints a JSON array of violation records followed, on a later
// line, by "Your code has been rated at X/10". The two parts are extracted
// independently: a broken JSON section still yields the score and a missing
// score line still yields the violations. Nothing here fails; unparseable
// input degrades to score 0 and an empty list.

// First JSON array that starts a line; empty if none parses.
std::vector<Violation> parse_violations(const std::string& raw, bool* parsed = nullptr);

// Score from the first "rated at" line; 0.0 when absent or malformed.
double parse_quality_score(const std::string& raw);

AnalysisOutcome parse_analysis_output(const std::string& raw);

// Carries the runner's execution error through; the output is parsed either
// way since a timed-out run may still have printed a usable prefix.
AnalysisOutcome analysis_from_invocation(const ToolInvocationResult& inv);

} // namespace reviser

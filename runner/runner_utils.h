#pragma once

#include "reviser/batch.h"
#include "reviser/config.h"

#include <iosfwd>
#include <string>

namespace reviser {

// Random run id (hex), one per CLI invocation.
std::string gen_run_id();

// Strict decimal parse: the whole string must be a number in [lo, hi].
bool parse_int_arg(const std::string& s, int lo, int hi, int* out);

// Prints config problems as "[config] ..." lines; true when there were any.
bool report_config_errors(const ReviserConfig& cfg, bool for_run);

void print_batch_report(std::ostream& out, const BatchReport& rep);

} // namespace reviser

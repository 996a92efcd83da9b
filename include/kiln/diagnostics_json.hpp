// diagnostics_json.hpp - JSON serialization of compile diagnostics
#pragma once
#include "kiln/diagnostics.hpp"
#include <string>
#include <vector>

namespace kiln {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize one compile outcome: {"success":..,"errors":[..],"warnings":[..]}
std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings);

// If KILN_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings);

} // namespace kiln

// diagnostics_json.hpp - JSON serialization of compile diagnostics
#pragma once
#include "ifacec/diagnostics.hpp"
#include <string>
#include <vector>

namespace ifacec {

struct CompileEnv;

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"success":..,"errors":[{"code","kind","message","hint","line","col","notes":[..]}]}
std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& ds);

// If IFACEC_DIAG_JSON=1 was set when the env snapshot was taken, print diagnostics JSON to stderr.
void maybe_print_json(const CompileEnv& env, bool success, const std::vector<Diagnostic>& ds);

} // namespace ifacec

// diagnostics_json.hpp - JSON serialization for compile results
#pragma once
#include "tinyc/compiler.hpp"
#include <string>

namespace tinyc {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a compile result to a compact JSON string.
std::string diagnostics_to_json(const compile_result& r);

// If TINYC_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const compile_result& r);

} // namespace tinyc

#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "tinyc/errors.hpp"
#include "tinyc/scanner.hpp"
#include "tinyc/parser.hpp"
#include "tinyc/traverse.hpp"
#include "tinyc/transform.hpp"
#include "tinyc/codegen.hpp"

namespace tinyc {

// scan -> parse -> transform -> generate. Throws the first compile_error raised by any stage.
std::string compile(std::string_view input);

struct compile_result {
    bool success{false};
    std::string output;               // generated text when success
    std::vector<diagnostic> errors;   // exactly one entry on failure
};

// Same pipeline with the failure captured as a diagnostic instead of thrown.
// Prints JSON diagnostics to stderr when TINYC_DIAG_JSON is set.
compile_result try_compile(std::string_view input);

} // namespace tinyc

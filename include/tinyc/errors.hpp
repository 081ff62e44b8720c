// Error hierarchy shared by every pipeline stage.
#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tinyc {

// Diagnostic codes (stable; used by tests and JSON output)
//  E0100 unrecognized character       E0101 unterminated string
//  E0200 expected callee name         E0201 unexpected token kind
//  E0202 unexpected end of tokens     E0203 nesting too deep
//  E0300 unknown node kind (walker)   E0400 unknown node kind (codegen)
struct compile_error : std::runtime_error
{
    compile_error(std::string code, const std::string &message, std::string hint = "")
        : std::runtime_error(message), code(std::move(code)), hint(std::move(hint)) {}
    std::string code;
    std::string hint;
};

struct lex_error : compile_error
{
    lex_error(std::string code, const std::string &message, std::optional<char> character, std::string hint = "")
        : compile_error(std::move(code), message, std::move(hint)), character(character) {}
    std::optional<char> character; // empty for an unterminated string
};

struct parse_error : compile_error
{
    parse_error(std::string code, const std::string &message, std::string kind, std::string hint = "")
        : compile_error(std::move(code), message, std::move(hint)), kind(std::move(kind)) {}
    std::string kind; // offending token kind, empty at end of tokens
};

struct traversal_error : compile_error
{
    traversal_error(const std::string &message, std::string kind)
        : compile_error("E0300", message, "source trees must be built by tinyc::parse"), kind(std::move(kind)) {}
    std::string kind;
};

struct codegen_error : compile_error
{
    codegen_error(const std::string &message, std::string kind)
        : compile_error("E0400", message, "target trees must be built by tinyc::transform"), kind(std::move(kind)) {}
    std::string kind;
};

struct diagnostic { std::string code; std::string message; std::string hint; };

inline diagnostic to_diagnostic(const compile_error &e) { return diagnostic{e.code, e.what(), e.hint}; }

} // namespace tinyc

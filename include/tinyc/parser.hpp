#pragma once
#include <cstddef>
#include <vector>

#include "tinyc/ast.hpp"
#include "tinyc/scanner.hpp"

namespace tinyc {

// Recursive-descent parse of a whole token sequence into a Program node.
// An empty sequence yields an empty Program. Throws parse_error on malformed input,
// including calls nested deeper than max_nesting_depth (E0203).
ast::node_ptr parse(const std::vector<token> &tokens);

// Bounds the recursion of every later stage (walker, generator, tree teardown).
constexpr size_t max_nesting_depth = 1000;

namespace detail
{
    struct token_cursor
    {
        const std::vector<token> &toks;
        size_t p = 0;
        size_t depth = 0; // calls currently open
        explicit token_cursor(const std::vector<token> &t) : toks(t) {}
        bool eof() const { return p >= toks.size(); }
        const token *peek() const { return eof() ? nullptr : &toks[p]; }
        const token &get() { return toks[p++]; }
    };

    ast::node_ptr parse_expression(token_cursor &c);
}

} // namespace tinyc

// Token model and scanner entry point.
#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "tinyc/errors.hpp"

namespace tinyc {

enum class token_kind { paren_open, paren_close, number, string, name };

struct token
{
    token_kind kind;
    std::string text;
};

inline bool operator==(const token &a, const token &b) { return a.kind == b.kind && a.text == b.text; }
inline bool operator!=(const token &a, const token &b) { return !(a == b); }

// "paren-open", "paren-close", "number", "string", "name"
const char *kind_name(token_kind k);

// Scan the whole input in a single left-to-right pass.
// Throws lex_error on the first unrecognized character or an unterminated string.
std::vector<token> scan(std::string_view input);

} // namespace tinyc

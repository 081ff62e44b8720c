#pragma once
#include <tao/pegtl.hpp>

namespace tinyc::scanner::grammar {
using namespace tao::pegtl;

// Token classes; whitespace separates tokens and is otherwise ignored
struct paren_open : one<'('> {};
struct paren_close : one<')'> {};
struct number : plus<digit> {};
struct name : plus<alpha> {};

// String literals are taken verbatim, no escapes
struct string_body : star<not_one<'"'>> {};
struct unterminated_string : eof {};
struct string_lit : seq<one<'"'>, string_body, sor<one<'"'>, unterminated_string>> {};

// Anything else is rejected by its action
struct unknown_char : any {};

struct token_rule : sor<space, paren_open, paren_close, number, string_lit, name, unknown_char> {};
struct input_rule : seq<star<token_rule>, eof> {};

} // namespace tinyc::scanner::grammar

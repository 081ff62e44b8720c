#pragma once
#include "grammar.hpp"
#include "tinyc/scanner.hpp"
#include <tao/pegtl.hpp>
#include <string>
#include <vector>

namespace tinyc::scanner::actions {
using namespace tao::pegtl;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::paren_open > {
    template<typename Input>
    static void apply(const Input&, std::vector<token>& out){ out.push_back(token{token_kind::paren_open, "("}); }
};

template<> struct action< grammar::paren_close > {
    template<typename Input>
    static void apply(const Input&, std::vector<token>& out){ out.push_back(token{token_kind::paren_close, ")"}); }
};

template<> struct action< grammar::number > {
    template<typename Input>
    static void apply(const Input& in, std::vector<token>& out){ out.push_back(token{token_kind::number, in.string()}); }
};

template<> struct action< grammar::name > {
    template<typename Input>
    static void apply(const Input& in, std::vector<token>& out){ out.push_back(token{token_kind::name, in.string()}); }
};

// Fires before the closing quote is checked; an unterminated literal throws right after.
template<> struct action< grammar::string_body > {
    template<typename Input>
    static void apply(const Input& in, std::vector<token>& out){ out.push_back(token{token_kind::string, in.string()}); }
};

template<> struct action< grammar::unterminated_string > {
    template<typename Input>
    static void apply(const Input&, std::vector<token>&){
        throw lex_error("E0101", "unterminated string literal", std::nullopt, "close the string with '\"'");
    }
};

template<> struct action< grammar::unknown_char > {
    template<typename Input>
    static void apply(const Input& in, std::vector<token>&){
        char c = in.begin()[0];
        throw lex_error("E0100", std::string("I dont know what this character is: ") + c, c,
                        "only parentheses, digits, letters, strings and whitespace are accepted");
    }
};

} // namespace tinyc::scanner::actions

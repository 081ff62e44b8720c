#include "tinyc/scanner.hpp"
#include "scanner/grammar.hpp"
#include "scanner/actions.hpp"
#include <tao/pegtl.hpp>

namespace tinyc {

const char *kind_name(token_kind k)
{
    switch (k)
    {
    case token_kind::paren_open: return "paren-open";
    case token_kind::paren_close: return "paren-close";
    case token_kind::number: return "number";
    case token_kind::string: return "string";
    case token_kind::name: return "name";
    }
    return "unknown";
}

std::vector<token> scan(std::string_view input)
{
    tao::pegtl::memory_input<> in(input.data(), input.size(), "tinyc");
    std::vector<token> out;
    // input_rule only stops at eof; every other character either forms a token or throws
    if (!tao::pegtl::parse<scanner::grammar::input_rule, scanner::actions::action>(in, out))
        throw lex_error("E0100", "scanner stopped before end of input", std::nullopt);
    return out;
}

} // namespace tinyc

#include "tinyc/parser.hpp"
#include <string>

namespace tinyc {

namespace detail {

static parse_error end_of_tokens(const std::string &where)
{
    return parse_error("E0202", "unexpected end of tokens " + where, "",
                       "every '(' needs a matching ')'");
}

static ast::node_ptr parse_call(token_cursor &c)
{
    c.get(); // '('
    if (++c.depth > max_nesting_depth)
        throw parse_error("E0203", "nesting too deep: more than " + std::to_string(max_nesting_depth) + " open calls", "",
                          "flatten the expression into several top-level calls");
    const token *callee = c.peek();
    if (!callee)
        throw end_of_tokens("after '('");
    if (callee->kind != token_kind::name)
        throw parse_error("E0200", std::string("expected callee name, found ") + kind_name(callee->kind),
                          kind_name(callee->kind), "a call is written (name arg ...)");
    ast::call_expression call;
    call.name = c.get().text;
    for (;;)
    {
        const token *t = c.peek();
        if (!t)
            throw end_of_tokens("in argument list of '" + call.name + "'");
        if (t->kind == token_kind::paren_close)
            break;
        call.params.push_back(parse_expression(c));
    }
    c.get(); // ')'
    --c.depth;
    return ast::make_node(std::move(call));
}

ast::node_ptr parse_expression(token_cursor &c)
{
    const token *t = c.peek();
    if (!t)
        throw end_of_tokens("at expression");
    switch (t->kind)
    {
    case token_kind::number:
        return ast::make_node(ast::number_literal{c.get().text});
    case token_kind::string:
        return ast::make_node(ast::string_literal{c.get().text});
    case token_kind::paren_open:
        return parse_call(c);
    default:
        break;
    }
    throw parse_error("E0201", std::string("unexpected token kind: ") + kind_name(t->kind), kind_name(t->kind),
                      "expressions are numbers, strings or (name arg ...) calls");
}

} // namespace detail

ast::node_ptr parse(const std::vector<token> &tokens)
{
    detail::token_cursor c(tokens);
    ast::program prog;
    while (!c.eof())
        prog.body.push_back(detail::parse_expression(c));
    return ast::make_node(std::move(prog));
}

} // namespace tinyc

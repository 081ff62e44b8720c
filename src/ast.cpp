#include "tinyc/ast.hpp"
#include "tinyc/target_ast.hpp"

namespace tinyc {

const char *ast::kind_name(const node &n)
{
    struct V
    {
        const char *operator()(std::monostate) const { return "<empty>"; }
        const char *operator()(const program &) const { return "Program"; }
        const char *operator()(const call_expression &) const { return "CallExpression"; }
        const char *operator()(const number_literal &) const { return "NumberLiteral"; }
        const char *operator()(const string_literal &) const { return "StringLiteral"; }
    };
    return std::visit(V{}, n.data);
}

const char *target::kind_name(const node &n)
{
    struct V
    {
        const char *operator()(std::monostate) const { return "<empty>"; }
        const char *operator()(const program &) const { return "Program"; }
        const char *operator()(const expression_statement &) const { return "ExpressionStatement"; }
        const char *operator()(const call_expression &) const { return "CallExpression"; }
        const char *operator()(const identifier &) const { return "Identifier"; }
        const char *operator()(const number_literal &) const { return "NumberLiteral"; }
        const char *operator()(const string_literal &) const { return "StringLiteral"; }
    };
    return std::visit(V{}, n.data);
}

} // namespace tinyc

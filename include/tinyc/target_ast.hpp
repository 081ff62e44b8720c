// Target tree produced by the transformer and consumed by the code generator.
#pragma once
#include <initializer_list>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tinyc::target
{

    struct node;
    using node_ptr = std::shared_ptr<node>;

    struct program
    {
        std::vector<node_ptr> body;
    };
    struct expression_statement
    {
        node_ptr expression;
    };
    struct identifier
    {
        std::string name;
    };
    struct call_expression
    {
        identifier callee;
        std::vector<node_ptr> arguments;
    };
    struct number_literal
    {
        std::string value;
    };
    struct string_literal
    {
        std::string value;
    };

    using node_data = std::variant<std::monostate, program, expression_statement, call_expression, identifier, number_literal, string_literal>;

    struct node
    {
        node_data data;
    };

    inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d)}); }

    const char *kind_name(const node &n);
    inline const char *kind_name(const node_ptr &p) { return p ? kind_name(*p) : "<null>"; }

    inline bool is_statement(const node &n) { return std::holds_alternative<expression_statement>(n.data); }
    inline bool is_call(const node &n) { return std::holds_alternative<call_expression>(n.data); }
    inline const program *as_program(const node &n) { return std::get_if<program>(&n.data); }
    inline const call_expression *as_call(const node &n) { return std::get_if<call_expression>(&n.data); }
    inline const expression_statement *as_statement(const node &n) { return std::get_if<expression_statement>(&n.data); }

    inline node_ptr n_ident(std::string name) { return make_node(identifier{std::move(name)}); }
    inline node_ptr n_num(std::string v) { return make_node(number_literal{std::move(v)}); }
    inline node_ptr n_str(std::string v) { return make_node(string_literal{std::move(v)}); }
    inline node_ptr n_stmt(node_ptr expr) { return make_node(expression_statement{std::move(expr)}); }
    inline node_ptr n_call(std::string callee, std::initializer_list<node_ptr> args = {})
    {
        call_expression c;
        c.callee.name = std::move(callee);
        c.arguments.assign(args.begin(), args.end());
        return make_node(std::move(c));
    }
    inline node_ptr n_program(std::initializer_list<node_ptr> body = {})
    {
        program p;
        p.body.assign(body.begin(), body.end());
        return make_node(std::move(p));
    }

} // namespace tinyc::target

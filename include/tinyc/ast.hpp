// Source tree produced by the parser: Program / CallExpression / literals.
#pragma once
#include <initializer_list>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tinyc::ast
{

    struct node; // forward declaration
    using node_ptr = std::shared_ptr<node>;

    struct program
    {
        std::vector<node_ptr> body;
    };
    struct call_expression
    {
        std::string name;
        std::vector<node_ptr> params;
    };
    struct number_literal
    {
        std::string value; // digits, verbatim
    };
    struct string_literal
    {
        std::string value; // quotes stripped
    };

    // std::monostate is the empty node: a kind no stage recognizes
    using node_data = std::variant<std::monostate, program, call_expression, number_literal, string_literal>;

    struct node
    {
        node_data data;
    };

    inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d)}); }

    // "Program", "CallExpression", "NumberLiteral", "StringLiteral" or "<empty>"
    const char *kind_name(const node &n);
    inline const char *kind_name(const node_ptr &p) { return p ? kind_name(*p) : "<null>"; }

    inline bool is_program(const node &n) { return std::holds_alternative<program>(n.data); }
    inline bool is_call(const node &n) { return std::holds_alternative<call_expression>(n.data); }
    inline const program *as_program(const node &n) { return is_program(n) ? &std::get<program>(n.data) : nullptr; }
    inline const call_expression *as_call(const node &n) { return is_call(n) ? &std::get<call_expression>(n.data) : nullptr; }

    // ------ Factory helpers ------
    inline node_ptr n_num(std::string v) { return make_node(number_literal{std::move(v)}); }
    inline node_ptr n_str(std::string v) { return make_node(string_literal{std::move(v)}); }
    inline node_ptr n_call(std::string name, std::initializer_list<node_ptr> params = {})
    {
        call_expression c;
        c.name = std::move(name);
        c.params.assign(params.begin(), params.end());
        return make_node(std::move(c));
    }
    inline node_ptr n_program(std::initializer_list<node_ptr> body = {})
    {
        program p;
        p.body.assign(body.begin(), body.end());
        return make_node(std::move(p));
    }

} // namespace tinyc::ast

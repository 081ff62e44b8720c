#pragma once
#include "tinyc/ast.hpp"
#include "tinyc/errors.hpp"
#include <functional>
#include <type_traits>

namespace tinyc {

// Depth-first walker over the source tree.
// For every node: enter(node, parent), then children in order, then exit(node, parent).
// Children: Program.body, CallExpression.params; literals have none.
// parent is nullptr only for the root. Kinds without registered callbacks are simply descended.
// An empty node (or a null child) raises traversal_error.

struct visitor_methods {
    using Fn = std::function<void(const ast::node&, const ast::node* parent)>;
    Fn enter;
    Fn exit;
};

// One slot per node kind; the walker dispatches exhaustively over ast::node_data.
struct visitor {
    visitor_methods program;
    visitor_methods call_expression;
    visitor_methods number_literal;
    visitor_methods string_literal;
};

void traverse(const ast::node_ptr& root, const visitor& v);

// Fluent registration front-end:
//   Walker{}.on_enter<ast::call_expression>(fn).on_exit<ast::call_expression>(fn2).traverse(root);
class Walker {
public:
    template<typename Kind>
    Walker& on_enter(visitor_methods::Fn fn){ slot<Kind>().enter = std::move(fn); return *this; }
    template<typename Kind>
    Walker& on_exit(visitor_methods::Fn fn){ slot<Kind>().exit = std::move(fn); return *this; }

    const visitor& methods() const { return v_; }
    void traverse(const ast::node_ptr& root) const { tinyc::traverse(root, v_); }

private:
    visitor v_;

    template<typename Kind>
    visitor_methods& slot(){
        if constexpr(std::is_same_v<Kind, ast::program>) return v_.program;
        else if constexpr(std::is_same_v<Kind, ast::call_expression>) return v_.call_expression;
        else if constexpr(std::is_same_v<Kind, ast::number_literal>) return v_.number_literal;
        else {
            static_assert(std::is_same_v<Kind, ast::string_literal>, "Walker: not a source node kind");
            return v_.string_literal;
        }
    }
};

} // namespace tinyc

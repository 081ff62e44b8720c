#include "tinyc/traverse.hpp"
#include <string>
#include <vector>

namespace tinyc {

namespace {

void traverse_node(const ast::node_ptr& n, const ast::node* parent, const visitor& v);

void traverse_array(const std::vector<ast::node_ptr>& xs, const ast::node& parent, const visitor& v){
    for(auto& ch : xs) traverse_node(ch, &parent, v);
}

void traverse_node(const ast::node_ptr& n, const ast::node* parent, const visitor& v){
    if(!n) throw traversal_error("null node in source tree", "<null>");
    struct Pick {
        const visitor& v;
        const visitor_methods* operator()(std::monostate) const { return nullptr; }
        const visitor_methods* operator()(const ast::program&) const { return &v.program; }
        const visitor_methods* operator()(const ast::call_expression&) const { return &v.call_expression; }
        const visitor_methods* operator()(const ast::number_literal&) const { return &v.number_literal; }
        const visitor_methods* operator()(const ast::string_literal&) const { return &v.string_literal; }
    };
    const visitor_methods* m = std::visit(Pick{v}, n->data);
    if(!m) throw traversal_error(std::string("unknown node kind: ") + ast::kind_name(*n), ast::kind_name(*n));

    if(m->enter) m->enter(*n, parent);
    if(auto* p = std::get_if<ast::program>(&n->data)) traverse_array(p->body, *n, v);
    else if(auto* c = std::get_if<ast::call_expression>(&n->data)) traverse_array(c->params, *n, v);
    if(m->exit) m->exit(*n, parent);
}

} // namespace

void traverse(const ast::node_ptr& root, const visitor& v){
    traverse_node(root, nullptr, v);
}

} // namespace tinyc

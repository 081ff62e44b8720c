#include "tinyc/transform.hpp"
#include <string>
#include <vector>

namespace tinyc {

target::node_ptr transform(const ast::node_ptr& source){
    if(!source || !ast::is_program(*source))
        throw traversal_error(std::string("transform expects a Program root, got ") + ast::kind_name(source),
                              ast::kind_name(source));

    auto out = target::make_node(target::program{});
    // Output collections: top is where the node being visited appends itself.
    // Starts at Program.body; each CallExpression pushes its own arguments on enter, pops on exit.
    std::vector<std::vector<target::node_ptr>*> sinks{ &std::get<target::program>(out->data).body };

    Walker w;
    w.on_enter<ast::number_literal>([&](const ast::node& n, const ast::node*){
        sinks.back()->push_back(target::n_num(std::get<ast::number_literal>(n.data).value));
    });
    w.on_enter<ast::string_literal>([&](const ast::node& n, const ast::node*){
        sinks.back()->push_back(target::n_str(std::get<ast::string_literal>(n.data).value));
    });
    w.on_enter<ast::call_expression>([&](const ast::node& n, const ast::node* parent){
        auto call = target::make_node(target::call_expression{ target::identifier{ std::get<ast::call_expression>(n.data).name }, {} });
        auto* args = &std::get<target::call_expression>(call->data).arguments;
        if(parent && ast::is_call(*parent)) sinks.back()->push_back(call);
        else sinks.back()->push_back(target::n_stmt(call));
        sinks.push_back(args);
    });
    w.on_exit<ast::call_expression>([&](const ast::node&, const ast::node*){
        sinks.pop_back();
    });
    w.traverse(source);
    return out;
}

} // namespace tinyc

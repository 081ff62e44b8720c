#include "tinyc/codegen.hpp"

namespace tinyc {

namespace {

std::string join(const std::vector<target::node_ptr>& xs, const char* sep){
    std::string out;
    bool first = true;
    for(auto& x : xs){
        if(!first) out += sep;
        first = false;
        out += generate(x);
    }
    return out;
}

} // namespace

std::string generate(const target::node_ptr& node){
    if(!node) throw codegen_error("null node in target tree", "<null>");
    struct V {
        std::string operator()(std::monostate) const { throw codegen_error("unknown node kind: <empty>", "<empty>"); }
        std::string operator()(const target::program& p) const { return join(p.body, "\n"); }
        std::string operator()(const target::expression_statement& s) const { return generate(s.expression) + ';'; }
        std::string operator()(const target::call_expression& c) const { return (*this)(c.callee) + '(' + join(c.arguments, ", ") + ')'; }
        std::string operator()(const target::identifier& i) const { return i.name; }
        std::string operator()(const target::number_literal& n) const { return n.value; }
        std::string operator()(const target::string_literal& s) const { return '"' + s.value + '"'; }
    };
    return std::visit(V{}, node->data);
}

} // namespace tinyc

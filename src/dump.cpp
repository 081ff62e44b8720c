#include "tinyc/dump.hpp"
#include "tinyc/diagnostics_json.hpp"

namespace tinyc {

namespace {

template<typename Ptr>
std::string json_array(const std::vector<Ptr>& xs){
    std::string out = "[";
    bool first = true;
    for(auto& x : xs){
        if(!first) out += ',';
        first = false;
        out += to_json(x);
    }
    out += ']';
    return out;
}

const char* token_type(token_kind k){
    switch(k){
        case token_kind::paren_open:
        case token_kind::paren_close: return "paren";
        case token_kind::number: return "number";
        case token_kind::string: return "string";
        case token_kind::name: return "name";
    }
    return "unknown";
}

std::string typed(const char* type, const std::string& rest){
    return std::string("{\"type\":\"") + type + "\"" + rest + "}";
}

} // namespace

std::string to_json(const std::vector<token>& tokens){
    std::string out = "[";
    for(size_t i=0;i<tokens.size();++i){
        if(i) out += ',';
        out += typed(token_type(tokens[i].kind), ",\"value\":" + json_escape(tokens[i].text));
    }
    out += ']';
    return out;
}

std::string to_json(const ast::node_ptr& n){
    if(!n) return "null";
    struct V {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(const ast::program& p) const { return typed("Program", ",\"body\":" + json_array(p.body)); }
        std::string operator()(const ast::call_expression& c) const { return typed("CallExpression", ",\"name\":" + json_escape(c.name) + ",\"params\":" + json_array(c.params)); }
        std::string operator()(const ast::number_literal& l) const { return typed("NumberLiteral", ",\"value\":" + json_escape(l.value)); }
        std::string operator()(const ast::string_literal& l) const { return typed("StringLiteral", ",\"value\":" + json_escape(l.value)); }
    };
    return std::visit(V{}, n->data);
}

std::string to_json(const target::node_ptr& n){
    if(!n) return "null";
    struct V {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(const target::program& p) const { return typed("Program", ",\"body\":" + json_array(p.body)); }
        std::string operator()(const target::expression_statement& s) const { return typed("ExpressionStatement", ",\"expression\":" + to_json(s.expression)); }
        std::string operator()(const target::call_expression& c) const { return typed("CallExpression", ",\"callee\":" + (*this)(c.callee) + ",\"arguments\":" + json_array(c.arguments)); }
        std::string operator()(const target::identifier& i) const { return typed("Identifier", ",\"name\":" + json_escape(i.name)); }
        std::string operator()(const target::number_literal& l) const { return typed("NumberLiteral", ",\"value\":" + json_escape(l.value)); }
        std::string operator()(const target::string_literal& l) const { return typed("StringLiteral", ",\"value\":" + json_escape(l.value)); }
    };
    return std::visit(V{}, n->data);
}

} // namespace tinyc

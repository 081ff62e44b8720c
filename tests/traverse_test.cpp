#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "tinyc/parser.hpp"
#include "tinyc/traverse.hpp"
#include "tinyc/dump.hpp"

using namespace tinyc;

// Label for logging: callee name for calls, value for literals
static std::string label(const ast::node* n){
    if(!n) return "null";
    if(auto* c = std::get_if<ast::call_expression>(&n->data)) return c->name;
    if(auto* l = std::get_if<ast::number_literal>(&n->data)) return l->value;
    if(auto* s = std::get_if<ast::string_literal>(&n->data)) return s->value;
    return ast::kind_name(*n);
}

static void test_enter_exit_order(){
    auto prog = parse(scan("(a 1 (b \"s\")) (c)"));
    std::vector<std::string> log;
    auto enter = [&](const ast::node& n, const ast::node* parent){ log.push_back("+" + label(&n) + "<" + label(parent)); };
    auto exit = [&](const ast::node& n, const ast::node*){ log.push_back("-" + label(&n)); };
    Walker w;
    w.on_enter<ast::program>(enter).on_exit<ast::program>(exit)
     .on_enter<ast::call_expression>(enter).on_exit<ast::call_expression>(exit)
     .on_enter<ast::number_literal>(enter).on_exit<ast::number_literal>(exit)
     .on_enter<ast::string_literal>(enter).on_exit<ast::string_literal>(exit);
    w.traverse(prog);
    std::vector<std::string> expected{
        "+Program<null",
        "+a<Program", "+1<a", "-1", "+b<a", "+s<b", "-s", "-b", "-a",
        "+c<Program", "-c",
        "-Program"};
    assert(log == expected);
}

static void test_partial_visitor(){
    auto prog = parse(scan("(a 1 (b 2 3) \"x\")"));
    int numbers = 0;
    visitor v;
    v.number_literal.enter = [&](const ast::node&, const ast::node* parent){
        assert(parent && ast::is_call(*parent));
        ++numbers;
    };
    traverse(prog, v);
    assert(numbers == 3);
    // no callbacks at all is a plain walk
    traverse(prog, visitor{});
}

static void test_walker_does_not_mutate(){
    auto prog = parse(scan("(a 1 (b \"two\"))"));
    auto before = to_json(prog);
    Walker w;
    w.on_enter<ast::call_expression>([](const ast::node&, const ast::node*){});
    w.traverse(prog);
    assert(to_json(prog) == before);
}

static void test_unknown_kind(){
    auto bad = ast::n_program({ ast::n_call("f", { ast::make_node(ast::node_data{}) }) });
    bool threw = false;
    try { traverse(bad, visitor{}); }
    catch(const traversal_error& e){ threw = true; assert(e.kind == "<empty>" && e.code == "E0300"); }
    assert(threw);

    threw = false;
    auto nullChild = ast::n_program({ ast::node_ptr{} });
    try { traverse(nullChild, visitor{}); }
    catch(const traversal_error& e){ threw = true; assert(e.kind == "<null>"); }
    assert(threw);

    // enter for the parent has already run when the bad child is reached
    int entered = 0;
    visitor v;
    v.call_expression.enter = [&](const ast::node&, const ast::node*){ ++entered; };
    try { traverse(bad, v); } catch(const traversal_error&) {}
    assert(entered == 1);
}

void run_traverse_tests(){
    test_enter_exit_order();
    test_partial_visitor();
    test_walker_does_not_mutate();
    test_unknown_kind();
    std::cout << "Traverse tests passed\n";
}

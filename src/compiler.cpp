#include "tinyc/compiler.hpp"
#include "tinyc/diagnostics_json.hpp"
#include "tinyc/env.hpp"
#include <cstdio>

namespace tinyc {

std::string compile(std::string_view input)
{
    const bool trace = trace_enabled();
    auto tokens = scan(input);
    if (trace) std::fprintf(stderr, "[tinyc][scan] tokens=%zu\n", tokens.size());
    auto tree = parse(tokens);
    if (trace) std::fprintf(stderr, "[tinyc][parse] top-level=%zu\n", std::get<ast::program>(tree->data).body.size());
    auto lowered = transform(tree);
    if (trace) std::fprintf(stderr, "[tinyc][transform] statements=%zu\n", std::get<target::program>(lowered->data).body.size());
    auto text = generate(lowered);
    if (trace) std::fprintf(stderr, "[tinyc][generate] bytes=%zu\n", text.size());
    return text;
}

compile_result try_compile(std::string_view input)
{
    compile_result r;
    try
    {
        r.output = compile(input);
        r.success = true;
    }
    catch (const compile_error &e)
    {
        if (trace_enabled()) std::fprintf(stderr, "[tinyc][error] %s %s\n", e.code.c_str(), e.what());
        r.errors.push_back(to_diagnostic(e));
    }
    maybe_print_json(r);
    return r;
}

} // namespace tinyc

// Compact JSON renderings of each intermediate stage (driver --tokens/--ast/--target-ast).
#pragma once
#include <string>
#include <vector>
#include "tinyc/scanner.hpp"
#include "tinyc/ast.hpp"
#include "tinyc/target_ast.hpp"

namespace tinyc {

// [{"type":"paren","value":"("},{"type":"name","value":"add"},...]
std::string to_json(const std::vector<token>& tokens);
// {"type":"Program","body":[{"type":"CallExpression","name":"add","params":[...]}]}
std::string to_json(const ast::node_ptr& n);
// {"type":"Program","body":[{"type":"ExpressionStatement","expression":{"type":"CallExpression","callee":{...},"arguments":[...]}}]}
std::string to_json(const target::node_ptr& n);

} // namespace tinyc

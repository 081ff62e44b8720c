#pragma once
#include <string>
#include "tinyc/target_ast.hpp"
#include "tinyc/errors.hpp"

namespace tinyc {

// Render a target tree as C-like call syntax.
//   Program             -> statements joined with '\n'
//   ExpressionStatement -> expr + ';'
//   CallExpression      -> callee(arg, arg, ...)
//   StringLiteral       -> "value" (no escaping)
// Throws codegen_error for an empty or null node.
std::string generate(const target::node_ptr& node);

} // namespace tinyc

#pragma once
#include "tinyc/ast.hpp"
#include "tinyc/target_ast.hpp"
#include "tinyc/traverse.hpp"

namespace tinyc {

// Rewrite a source Program into the target shape:
//   (name a b)      -> CallExpression{callee: Identifier{name}, arguments: [a', b']}
//   top-level calls -> wrapped in ExpressionStatement; nested calls stay bare
//   literals        -> copied unchanged
// The source tree is not modified. Throws traversal_error for a non-Program root
// or an unrecognized node kind.
target::node_ptr transform(const ast::node_ptr& program);

} // namespace tinyc

#pragma once

#include <ast_fwd.hpp>

#include <cstddef>

namespace ktree
{

// Compares kind, scalar attributes and children recursively. Ids are ignored.
bool structurally_equal(const node_ptr& lhs, const node_ptr& rhs);

// Reads an expression as a type: a name, a call carrying only type arguments,
// or a dot-qualified chain of those. Returns null for anything else.
node_ptr to_type(const node_ptr& expression);

// Nests `type` in `question_marks` nullable types.
node_ptr wrap_nullable(const node_ptr& type, std::size_t question_marks);

// The lambda a statement stands for, looking through annotations and labels.
lambda_expression_ptr lambda_expression_of(const node_ptr& statement);

}

/**
 * @file
 * @brief AST base Node default accept implementation.
 */
/***
 * Name: pysca::ast::Node::accept
 * Purpose: Dynamic dispatch via central switch on NodeKind.
 */
#include "ast/Node.h"
#include "ast/Visitor.h"

namespace pysca::ast {

void Node::accept(VisitorBase& visitor) const {
    dispatch(*this, visitor);
}

} // namespace pysca::ast

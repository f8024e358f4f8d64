/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once

#include "ast/Node.h"

namespace pysca::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace pysca::ast
